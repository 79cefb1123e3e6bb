// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#include <string_view>
#include <fmt/core.h>
#include <lumen/brand.hpp>
#include <lumen/utils.hpp>

namespace lumen::brand {
namespace {

struct entry {
    std::string_view code;
    std::string_view name;
};

// https://uefi.org/pnp_id_list
constexpr entry pnp_ids[] = {
    {"AAC", "AcerView"},
    {"ACI", "Asus"},
    {"ACR", "Acer"},
    {"AIC", "AG Neovo"},
    {"AOC", "AOC"},
    {"API", "Acer"},
    {"APP", "Apple"},
    {"ART", "ArtMedia"},
    {"AST", "AST Research"},
    {"AUO", "AU Optronics"},
    {"AUS", "Asus"},
    {"BMM", "BMM"},
    {"BNQ", "BenQ"},
    {"BOE", "BOE"},
    {"CMN", "Chimei Innolux"},
    {"CMO", "Chi Mei Optoelectronics"},
    {"CPL", "Compal"},
    {"CPQ", "Compaq"},
    {"CTX", "CTX"},
    {"DEC", "DEC"},
    {"DEL", "Dell"},
    {"DPC", "Delta"},
    {"DWE", "Daewoo"},
    {"ECS", "ELITEGROUP Computer Systems"},
    {"EIZ", "EIZO"},
    {"ENC", "EIZO"},
    {"EPI", "Envision"},
    {"FCM", "Funai"},
    {"FUS", "Fujitsu Siemens"},
    {"GSM", "LG"},
    {"GWY", "Gateway 2000"},
    {"HEI", "Hyundai"},
    {"HIQ", "Hyundai ImageQuest"},
    {"HIT", "Hyundai"},
    {"HPN", "HP"},
    {"HSD", "Hannspree"},
    {"HSL", "Hansol"},
    {"HTC", "Hitachi"},
    {"HWP", "HP"},
    {"IBM", "IBM"},
    {"ICL", "Fujitsu ICL"},
    {"IFS", "InFocus"},
    {"IQT", "Hyundai"},
    {"IVM", "Iiyama"},
    {"KDS", "KDS"},
    {"KFC", "KFC Computek"},
    {"LEN", "Lenovo"},
    {"LGD", "LG Display"},
    {"LKM", "ADLAS / AZALEA"},
    {"LNK", "LINK Technologies"},
    {"LPL", "LG Philips"},
    {"LTN", "Lite-On"},
    {"MAG", "MAG InnoVision"},
    {"MAX", "Maxdata Computer"},
    {"MEI", "Panasonic"},
    {"MEL", "Mitsubishi Electronics"},
    {"MSI", "MSI"},
    {"NEC", "NEC"},
    {"PHL", "Philips"},
    {"SAM", "Samsung"},
    {"SDC", "Samsung Display"},
    {"SEC", "Seiko Epson"},
    {"SHP", "Sharp"},
    {"SNY", "Sony"},
    {"TOS", "Toshiba"},
    {"VIZ", "Vizio"},
    {"VSC", "ViewSonic"},
    {"WAC", "Wacom"},
};

}

std::pair<std::string, std::string> lookup(std::string_view code_or_name) {
    const std::string code = to_upper(code_or_name);
    for (const auto &e : pnp_ids) {
        if (e.code == code)
            return {std::string(e.code), std::string(e.name)};
    }

    for (const auto &e : pnp_ids) {
        if (iequals(e.name, code_or_name))
            return {std::string(e.code), std::string(e.name)};
    }

    throw lookup_error(fmt::format("unknown monitor brand: '{}'", code_or_name));
}

}
