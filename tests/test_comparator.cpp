#include <catch2/catch_test_macros.hpp>

#include <extraction_eval/comparator.hpp>

#include "test_utils.hpp"

#include <cstdint>
#include <vector>

using namespace extraction_eval;
using namespace extraction_eval::tests;
using nlohmann::json;

namespace {

ComparisonConfig make_config(
    double tolerance = 0.0, bool fuzzy = false, bool ordered = false)
{
    ComparisonConfig c;
    c.numeric_tolerance = tolerance;
    c.fuzzy_strings = fuzzy;
    c.list_order_matters = ordered;
    return c;
}

} // namespace

TEST_CASE("Boolean truth is an exact match", "[comparator][boolean]")
{
    const ComparisonConfig cfg = make_config();

    check_count(compare(true, true, cfg), 1, 0, 0);
    check_count(compare(true, false, cfg), 0, 1, 0);
    check_count(compare(false, true, cfg), 0, 0, 1);
    check_count(compare(false, false, cfg), 1, 0, 0);

    // absent answer for a false truth: nothing claimed, nothing missed
    const Count c = compare(json(), false, cfg);
    check_count(c, 0, 0, 0);
    CHECK(c.true_negatives == 1);

    // non-boolean answers are read by truthiness
    check_count(compare("yes", false, cfg), 0, 1, 0);
    check_count(compare(json(), true, cfg), 0, 0, 1);
    check_count(compare("", true, cfg), 0, 0, 1);
    CHECK(compare("", false, cfg).true_negatives == 1);

    // 1 and 0 are the same answer as true and false
    check_count(compare(1, true, cfg), 1, 0, 0);
    check_count(compare(0, false, cfg), 1, 0, 0);
    check_count(compare(1.0, true, cfg), 1, 0, 0);
    check_count(compare(1, false, cfg), 0, 1, 0);
    check_count(compare(0, true, cfg), 0, 0, 1);
    check_count(compare(2, true, cfg), 0, 0, 0);
    CHECK(compare(2, true, cfg).true_negatives == 1);
}

TEST_CASE("Numeric truth honours the tolerance", "[comparator][numeric]")
{
    SECTION("tolerance 0.5")
    {
        const ComparisonConfig cfg = make_config(0.5);
        check_count(compare(5.3, 5.0, cfg), 1, 0, 0);
        check_count(compare(4.5, 5.0, cfg), 1, 0, 0);
        check_count(compare(6.0, 5.0, cfg), 0, 1, 1);
    }
    SECTION("tolerance 0 is exact equality")
    {
        const ComparisonConfig cfg = make_config();
        check_count(compare(5, 5.0, cfg), 1, 0, 0);
        check_count(compare(5.0001, 5.0, cfg), 0, 1, 1);
    }
    SECTION("numeric strings are coerced")
    {
        const ComparisonConfig cfg = make_config();
        check_count(compare("120", 120, cfg), 1, 0, 0);
        check_count(compare(" 7.5 ", 7.5, cfg), 1, 0, 0);
        check_count(compare("about 120", 120, cfg), 0, 1, 1);
    }
    SECTION("missing or structured answers are wrong")
    {
        const ComparisonConfig cfg = make_config(1.0);
        check_count(compare(json(), 3, cfg), 0, 1, 1);
        check_count(compare(json::array({ 3 }), 3, cfg), 0, 1, 1);
    }
}

TEST_CASE("String truth with optional normalization", "[comparator][string]")
{
    SECTION("exact")
    {
        const ComparisonConfig cfg = make_config();
        check_count(compare("Apis", "Apis", cfg), 1, 0, 0);
        check_count(compare("apis", "Apis", cfg), 0, 1, 1);
        check_count(compare(json(), "Apis", cfg), 0, 1, 1);
    }
    SECTION("fuzzy lower-cases and collapses whitespace")
    {
        const ComparisonConfig cfg = make_config(0.0, true);
        check_count(compare("apis", "Apis", cfg), 1, 0, 0);
        check_count(compare("  Apis \t mellifera\n", "apis mellifera", cfg), 1, 0, 0);
        check_count(compare("apismellifera", "apis mellifera", cfg), 0, 1, 1);
    }
    SECTION("non-string answers use their textual form")
    {
        const ComparisonConfig cfg = make_config();
        check_count(compare(3, "3", cfg), 1, 0, 0);
        check_count(compare(true, "true", cfg), 1, 0, 0);
        // JSON spelling, not capitalized
        check_count(compare(true, "True", cfg), 0, 1, 1);
        check_count(compare(true, "True", make_config(0.0, true)), 1, 0, 0);
    }
}

TEST_CASE("Null truth expects an empty answer", "[comparator][null]")
{
    const ComparisonConfig cfg = make_config();

    check_count(compare(json(), json(), cfg), 1, 0, 0);
    check_count(compare("", json(), cfg), 1, 0, 0);
    check_count(compare(json::array(), json(), cfg), 1, 0, 0);

    // nothing to miss, so never a false negative
    check_count(compare("Apis", json(), cfg), 0, 1, 0);
    check_count(compare(0, json(), cfg), 0, 1, 0);
    check_count(compare(json::object(), json(), cfg), 0, 1, 0);
}

TEST_CASE("Objects are compared field by field", "[comparator][mapping]")
{
    const ComparisonConfig cfg = make_config();

    SECTION("case mismatch in one field")
    {
        const json automated = { { "species", "apis" }, { "count", 3 } };
        const json truth = { { "species", "Apis" }, { "count", 3 } };
        check_count(compare(automated, truth, cfg), 1, 1, 1);
    }
    SECTION("union of keys")
    {
        // "b" missing on the automated side, "c" only on the automated side
        const json automated = { { "a", 1 }, { "c", "extra" } };
        const json truth = { { "a", 1 }, { "b", "x" } };
        check_count(compare(automated, truth, cfg), 1, 2, 1);
    }
    SECTION("nested objects recurse")
    {
        const json automated = {
            { "site", { { "country", "Kenya" }, { "elevation", 1200 } } },
        };
        const json truth = {
            { "site", { { "country", "Kenya" }, { "elevation", 1250 } } },
        };
        check_count(compare(automated, truth, cfg), 1, 1, 1);
        check_count(compare(automated, truth, make_config(100.0)), 2, 0, 0);
    }
    SECTION("scalar answer for an object truth")
    {
        const json truth = { { "a", "x" }, { "b", true } };
        check_count(compare("oops", truth, cfg), 0, 1, 2);
    }
}

TEST_CASE("Fallback is exact equality", "[comparator][fallback]")
{
    const ComparisonConfig cfg = make_config();
    const json blob = json::binary(std::vector<std::uint8_t> { 1, 2, 3 });
    const json other = json::binary(std::vector<std::uint8_t> { 4 });

    check_count(compare(blob, blob, cfg), 1, 0, 0);
    check_count(compare(other, blob, cfg), 0, 1, 1);
    check_count(compare("123", blob, cfg), 0, 1, 1);
}

TEST_CASE("Value helpers", "[comparator][value]")
{
    CHECK(normalize_string("  Apis\t\tMellifera ", true) == "apis mellifera");
    CHECK(normalize_string("  Apis ", false) == "  Apis ");
    CHECK(normalize_string("   ", true).empty());

    CHECK(to_text("abc") == "abc");
    CHECK(to_text(12) == "12");
    CHECK(to_text(json { 1, 2 }) == "[1,2]");

    CHECK(as_number("1e3") == 1000.0);
    CHECK_FALSE(as_number("1e3x").has_value());
    CHECK_FALSE(as_number("").has_value());
    CHECK(as_number(true) == 1.0);

    CHECK_FALSE(is_truthy(""));
    CHECK_FALSE(is_truthy(0));
    CHECK_FALSE(is_truthy(json::object()));
    CHECK(is_truthy("no"));

    CHECK(union_of_keys(json { { "a", 1 } }, json { { "b", 2 }, { "a", 3 } }).size() == 2);
    CHECK(union_of_keys("x", json()).empty());
}
