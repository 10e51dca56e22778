// Fuzz target for device address parsing
// Tests ParseHostPort, SafeParsePort and DetectInterfaceType
//
// The --address argument is free-form user input. Bugs in this code can:
// - Crash on malformed brackets or ports (substr out of range)
// - Accept ports outside 1-65535
// - Pick a transport inconsistently for the same input
//
// Target code:
// - src/util/netaddress.cpp
// - src/network/interface_factory.cpp (DetectInterfaceType)

#include "network/interface_factory.hpp"
#include "util/netaddress.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace meshprobe;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > 256) return 0;

    std::string address(reinterpret_cast<const char *>(data), size);

    auto parsed = util::ParseHostPort(address, 4403);
    if (parsed) {
        if (parsed->host.empty() || parsed->port == 0) {
            __builtin_trap();
        }
    }

    auto port = util::SafeParsePort(address);
    if (port && *port == 0) {
        __builtin_trap();
    }

    // Detection must be deterministic
    if (network::DetectInterfaceType(address) != network::DetectInterfaceType(address)) {
        __builtin_trap();
    }

    (void)util::IsValidIPAddress(address);
    (void)util::IsMacAddress(address);

    return 0;
}
