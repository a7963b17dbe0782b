#include <catch2/catch_test_macros.hpp>
#include <squirrel/core/uuid.h>

#include <cstddef>
#include <set>
#include <string>

using namespace squirrel::core;

namespace {

bool is_ascii_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

TEST_CASE("generateUUID - format and uniqueness", "[core][uuid]") {
    SECTION("UUID has correct format") {
        auto uuid = generateUUID();
        REQUIRE(uuid.size() == 36);
        // Version 4 nibble and RFC 4122 variant
        CHECK(uuid[14] == '4');
        char v = uuid[19];
        CHECK((v == '8' || v == '9' || v == 'a' || v == 'b'));

        for (std::size_t i = 0; i < uuid.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                CHECK(uuid[i] == '-');
            } else {
                CHECK(is_ascii_lower_hex(uuid[i]));
            }
        }
        CHECK(isUUID(uuid));
    }

    SECTION("Many UUIDs are unique") {
        std::set<std::string> seen;
        for (int i = 0; i < 64; ++i) {
            seen.insert(generateUUID());
        }
        CHECK(seen.size() == 64);
    }
}

TEST_CASE("isUUID - rejects malformed identifiers", "[core][uuid]") {
    CHECK(isUUID("123e4567-E89B-12d3-a456-426614174000"));
    CHECK_FALSE(isUUID(""));
    CHECK_FALSE(isUUID("123e4567e89b12d3a456426614174000"));
    CHECK_FALSE(isUUID("123e4567-e89b-12d3-a456-42661417400g"));
    CHECK_FALSE(isUUID("123e4567-e89b-12d3-a456_426614174000"));
}
