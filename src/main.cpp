// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "zspawn/app.h"

int main(int argc, char **argv)
{
    return zspawn::main(argc, argv);
}
