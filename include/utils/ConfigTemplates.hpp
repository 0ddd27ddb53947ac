// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <vector>
#include <string>

namespace BerryTemplates {

    // init-config: dokumentált alapértelmezett blueberry.conf
    extern const std::vector<std::string> DEFAULT_CONFIG_CONTENT;

    // Dry-run: determinisztikus "xinput list" kimenet (egy egér id=9, egy vezetékes billentyűzet id=10)
    extern const std::string MOCK_XINPUT_LISTING;

    // Dry-run: "loginctl list-sessions --no-legend" egysoros kimenete
    extern const std::string MOCK_LOGINCTL_SESSIONS;
}

#endif
