#include "plugctl/app/App.hpp"
#include "plugctl/config/HostCanonicalizer.hpp"
#include "plugctl/tuya/TuyaOutletTransport.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    plugctl::config::DnsHostCanonicalizer canonicalizer;
    plugctl::app::App app(canonicalizer, plugctl::tuya::makeTuyaTransport, std::cout, std::cerr);
    return app.run(argc, argv);
}
