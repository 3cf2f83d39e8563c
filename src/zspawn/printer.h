// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "zspawn/container_record.h"
#include "zspawn/interface.h"

#include <ostream>
#include <vector>

namespace zspawn {
class printer : public virtual interface
{
protected:
    explicit printer(std::ostream &out)
        : out_(out)
    {
    }

    [[nodiscard]] auto out() const noexcept -> std::ostream & { return out_; }

public:
    ~printer() override;

    printer(const printer &) = delete;
    auto operator=(const printer &) -> printer & = delete;
    printer(printer &&) = delete;
    auto operator=(printer &&) -> printer & = delete;

    virtual void print_records(const std::vector<container_record_t> &records) = 0;

private:
    std::ostream &out_;
};
} // namespace zspawn
