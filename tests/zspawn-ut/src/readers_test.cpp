// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "testing.h"
#include "zspawn/readers.h"

namespace {

auto names_of(const std::vector<zspawn::volume_usage_t> &volumes) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (const auto &volume : volumes) {
        names.push_back(volume.name);
    }

    return names;
}

} // namespace

TEST(Readers, TrimAndCanonicalId)
{
    EXPECT_EQ(zspawn::trim("  web \n"), "web");
    EXPECT_EQ(zspawn::trim("\t\n"), "");

    EXPECT_TRUE(zspawn::is_canonical_id("1"));
    EXPECT_TRUE(zspawn::is_canonical_id("253"));
    EXPECT_FALSE(zspawn::is_canonical_id("0"));
    EXPECT_FALSE(zspawn::is_canonical_id("007"));
    EXPECT_FALSE(zspawn::is_canonical_id("12a"));
    EXPECT_FALSE(zspawn::is_canonical_id(""));
}

TEST(Readers, VolumeListSkipsDatasetAndSortsNumerically)
{
    const std::string output = "tank/machines\t3G\t100G\t96K\n"
                               "tank/machines/10\t1G\t100G\t1G\n"
                               "tank/machines/2\t1G\t100G\t1G\n"
                               "tank/machines/33\t1G\t100G\t1G\n"
                               "tank/machines/33.bak\t1G\t100G\t1G\n";

    auto volumes = zspawn::parse_volume_list(output, "tank/machines");
    ASSERT_EQ(volumes.size(), 4U);
    EXPECT_EQ(volumes[0].name, "10");
    EXPECT_EQ(volumes[0].used, "1G");
    EXPECT_EQ(volumes[0].available, "100G");
    EXPECT_EQ(volumes[0].referenced, "1G");

    auto containers = zspawn::select_containers(volumes, ".bak");
    EXPECT_EQ(names_of(containers), (std::vector<std::string>{ "2", "10", "33" }));
}

TEST(Readers, NonNumericNamesSortLast)
{
    std::vector<zspawn::volume_usage_t> volumes{
        { "scratch", "", "", "" },
        { "100", "", "", "" },
        { "9", "", "", "" },
        { "attic", "", "", "" },
    };

    EXPECT_EQ(names_of(zspawn::select_containers(volumes, ".bak")),
              (std::vector<std::string>{ "9", "100", "attic", "scratch" }));
}

TEST(Readers, VolumeListRejectsMalformedLines)
{
    EXPECT_THROW(zspawn::parse_volume_list("tank/machines/5 1G\n", "tank/machines"),
                 std::runtime_error);
    EXPECT_THROW(zspawn::parse_volume_list("other/5\t1G\t1G\t1G\n", "tank/machines"),
                 std::runtime_error);
}

TEST(Readers, RunningList)
{
    const std::string output = "MACHINE CLASS     SERVICE        OS     VERSION ADDRESSES\n"
                               "105     container systemd-nspawn debian 12      172.17.0.105\n"
                               "7       container systemd-nspawn debian 12      172.17.0.7\n"
                               "\n"
                               "2 machines listed.\n";

    EXPECT_EQ(zspawn::parse_running_list(output), (std::vector<std::string>{ "105", "7" }));
    EXPECT_TRUE(zspawn::parse_running_list("No machines.\n").empty());
}

TEST(Readers, Addresses)
{
    const std::string config = "[Match]\nName=host0\n\n[Network]\n"
                               "Address=172.17.0.5/24\nAddress=fd00::5\nGateway=172.17.0.1\n";

    EXPECT_EQ(zspawn::parse_addresses(config),
              (std::vector<std::string>{ "172.17.0.5", "fd00::5" }));
    EXPECT_TRUE(zspawn::parse_addresses("[Match]\nName=host0\n").empty());
}
