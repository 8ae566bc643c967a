#include "util/bipolar_array.hpp"

#include <doctest.h>

TEST_CASE("BipolarArray") {
    SUBCASE("negative_and_zero") {
        auto a = phabstack::BipolarArray<unsigned int>(-1, 1);
        a[0] = 7;
        a[-1] = 3;

        REQUIRE(a[0] == 7);
        REQUIRE(a[-1] == 3);
    }

    SUBCASE("whole_range") {
        auto a = phabstack::BipolarArray<int>(-5, 5);
        for (int i = -5; i <= 5; i++) {
            a[i] = i * 2;
        }
        for (int i = -5; i <= 5; i++) {
            CHECK(a[i] == i * 2);
        }
    }

    SUBCASE("copy_is_deep") {
        auto a = phabstack::BipolarArray<int>(-2, 2);
        for (int i = -2; i <= 2; i++) {
            a[i] = i;
        }
        auto b = a;
        a[1] = 100;
        CHECK(b[1] == 1);
        CHECK(b[-2] == -2);
    }
}
