#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"

#include <cassert>
#include <stdexcept>
#include <string>

using namespace mcprelay::sdk;

int main() {
    // value || salt: "ab" + "c" is the SHA-256 test vector for "abc"
    {
        HashService hasher("c");
        auto digest = hasher.hash("ab");
        assert(digest.is_ok());
        assert(digest.value() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    HashService first("salt-one");
    HashService second("salt-two");

    const auto a = first.hash("9f1c2d3e-machine");
    const auto b = first.hash("9f1c2d3e-machine");
    assert(a.is_ok() && b.is_ok());
    assert(a.value() == b.value());
    assert(a.value().size() == 64);
    assert(a.value().find_first_not_of("0123456789abcdef") == std::string::npos);

    const auto other_salt = second.hash("9f1c2d3e-machine");
    assert(other_salt.is_ok());
    assert(other_salt.value() != a.value());

    const auto other_value = first.hash("9f1c2d3e-machinf");
    assert(other_value.is_ok());
    assert(other_value.value() != a.value());

    const auto empty = first.hash("");
    assert(empty.is_ok());
    assert(empty.value().size() == 64);
    assert(empty.value() != a.value());
    assert(empty.value() == first.hash("").value());

    bool threw = false;
    try {
        HashService unsalted("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(HashService::equals(a.value(), b.value()));
    assert(!HashService::equals(a.value(), other_salt.value()));
    assert(!HashService::equals(a.value(), a.value().substr(0, 63)));
    assert(!HashService::equals("", a.value()));

    std::string secret = "3b8e8f0a-api-key";
    HashService::wipe(secret);
    assert(secret.empty());

    const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    assert(HashService::to_hex(bytes, sizeof(bytes)) == "000fa0ff");

    assert(SecureLogger::redact(a.value()) == a.value().substr(0, 12) + "...");
    assert(SecureLogger::redact("short") == "short");

    return 0;
}
