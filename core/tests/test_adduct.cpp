#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "gslgen/adduct.hpp"
#include "gslgen/elements.hpp"
#include "gslgen/errors.hpp"

using namespace gslgen;
using Catch::Approx;

namespace {

// Cer 18:1;2/16:0, C34H67NO3
constexpr Mass CERAMIDE_MASS = 537.51209503111;

} // namespace

TEST_CASE("Protonated and deprotonated ions", "[adduct]") {
    const AdductDef& plus_h = AdductCatalog::get("[M+H]+");
    const AdductDef& minus_h = AdductCatalog::get("[M-H]-");

    SECTION("Singly charged") {
        REQUIRE(plus_h.mz(CERAMIDE_MASS, 1) == Approx(538.519371497922).margin(1e-9));
        REQUIRE(minus_h.mz(CERAMIDE_MASS, 1) ==
                Approx(CERAMIDE_MASS - PROTON_MASS).margin(1e-9));
    }

    SECTION("Multiply charged") {
        const Mass gd1a = 1836.97207105894;
        REQUIRE(minus_h.mz(gd1a, 2) == Approx(917.478759062658).margin(1e-9));
        REQUIRE(minus_h.mz(gd1a, 3) == Approx(611.3167472195013).margin(1e-9));
        REQUIRE(plus_h.mz(gd1a, 2) == Approx((gd1a + 2 * PROTON_MASS) / 2).margin(1e-9));
    }

    SECTION("Ion names per charge") {
        REQUIRE(plus_h.ionName(1) == "[M+H]1+");
        REQUIRE(plus_h.ionName(2) == "[M+2H]2+");
        REQUIRE(minus_h.ionName(3) == "[M-3H]3-");
    }

    SECTION("Signed charges") {
        REQUIRE(plus_h.signedCharge(2) == 2);
        REQUIRE(minus_h.signedCharge(2) == -2);
        REQUIRE(toString(minus_h.polarity) == "negative");
    }
}

TEST_CASE("Carrier adducts", "[adduct]") {
    SECTION("Sodium") {
        const AdductDef& na = AdductCatalog::get("[M+Na]+");
        const Mass na_ion = ElementTable::mass("Na") - ELECTRON_MASS;
        REQUIRE(na.carrierIonMass() == Approx(na_ion).margin(1e-12));
        REQUIRE(na.mz(CERAMIDE_MASS, 1) == Approx(CERAMIDE_MASS + na_ion).margin(1e-9));
        REQUIRE(na.mz(CERAMIDE_MASS, 2) ==
                Approx((CERAMIDE_MASS + na_ion + PROTON_MASS) / 2).margin(1e-9));
        REQUIRE(na.ionName(1) == "[M+Na]1+");
        REQUIRE(na.ionName(2) == "[M+H+Na]2+");
    }

    SECTION("Two sodium carriers need charge 2") {
        const AdductDef& na2 = AdductCatalog::get("[M+2Na]+");
        REQUIRE(na2.minCharge() == 2);
        REQUIRE_FALSE(na2.supportsCharge(1));
        REQUIRE(na2.ionName(2) == "[M+2Na]2+");
        REQUIRE(na2.ionName(3) == "[M+H+2Na]3+");
        REQUIRE_THROWS_AS(na2.mz(CERAMIDE_MASS, 1), ConfigurationError);
    }

    SECTION("Ammonium") {
        const AdductDef& nh4 = AdductCatalog::get("[M+NH4]+");
        REQUIRE(nh4.mz(CERAMIDE_MASS, 1) == Approx(555.545920584921).margin(1e-9));
    }

    SECTION("Acetate and formate") {
        const AdductDef& acetate = AdductCatalog::get("[M+CH3COO]-");
        const AdductDef& formate = AdductCatalog::get("[M+HCOO]-");
        REQUIRE(acetate.mz(CERAMIDE_MASS, 1) == Approx(596.525947952309).margin(1e-9));
        REQUIRE(formate.mz(CERAMIDE_MASS, 1) == Approx(582.510297887849).margin(1e-9));
        REQUIRE(acetate.ionName(1) == "[M+CH3COO]1-");
        REQUIRE(acetate.ionName(2) == "[M-H+CH3COO]2-");
    }

    SECTION("Charges above the maximum are unsupported") {
        REQUIRE_FALSE(AdductCatalog::get("[M+H]+").supportsCharge(MAX_CHARGE + 1));
        REQUIRE_FALSE(AdductCatalog::get("[M+H]+").supportsCharge(0));
    }
}

TEST_CASE("Adduct catalog", "[adduct]") {
    SECTION("Bare names resolve") {
        REQUIRE(AdductCatalog::get("M+H").name == "[M+H]+");
        REQUIRE(AdductCatalog::contains("M-H"));
    }

    SECTION("Unknown adducts throw") {
        REQUIRE_FALSE(AdductCatalog::contains("[M+K]+"));
        REQUIRE_THROWS_AS(AdductCatalog::get("[M+K]+"), ConfigurationError);
    }

    SECTION("Resolve keeps order and drops duplicates") {
        auto adducts = AdductCatalog::resolve({"[M-H]-", "[M+H]+", "M-H"});
        REQUIRE(adducts.size() == 2);
        REQUIRE(adducts[0].name == "[M-H]-");
        REQUIRE(adducts[1].name == "[M+H]+");
    }
}
