#include "catch2/catch.hpp"

#include "oui/registry/record.hpp"

using namespace liboui::registry;
using reason = parse_error::reason_type;

static reason parse_failure(std::string_view line, char delimiter = ';')
{
    auto result = parse_record(line, parse_options{delimiter});
    REQUIRE(!result);
    return (result.error().reason);
}

TEST_CASE("prefix width helpers", "[liboui]")
{
    REQUIRE(prefix_bits(prefix_width::ma_l) == 24);
    REQUIRE(prefix_bits(prefix_width::ma_m) == 28);
    REQUIRE(prefix_bits(prefix_width::ma_s) == 36);

    REQUIRE(prefix_mask(prefix_width::ma_l) == 0xffffff000000);
    REQUIRE(prefix_mask(prefix_width::ma_m) == 0xfffffff00000);
    REQUIRE(prefix_mask(prefix_width::ma_s) == 0xfffffffff000);

    REQUIRE(to_prefix_width(24) == prefix_width::ma_l);
    REQUIRE(to_prefix_width(36) == prefix_width::ma_s);
    REQUIRE(!to_prefix_width(32));

    REQUIRE(to_string(prefix_width::ma_m) == "MA-M");
}

TEST_CASE("registry record parsing", "[liboui]")
{
    SECTION("widths are inferred from the digit count")
    {
        auto ma_l = parse_record("ACDE48;Example Corp;1 Example Way");
        REQUIRE(ma_l);
        REQUIRE(ma_l->width == prefix_width::ma_l);
        REQUIRE(ma_l->prefix == 0xacde48000000);
        REQUIRE(ma_l->organization == "Example Corp");
        REQUIRE(ma_l->address == std::optional<std::string>("1 Example Way"));

        auto ma_m = parse_record("70B3D51;Medium Org");
        REQUIRE(ma_m);
        REQUIRE(ma_m->width == prefix_width::ma_m);
        REQUIRE(ma_m->prefix == 0x70b3d5100000);
        REQUIRE(!ma_m->address);

        auto ma_s = parse_record("70b3d5abc;Small Org;");
        REQUIRE(ma_s);
        REQUIRE(ma_s->width == prefix_width::ma_s);
        REQUIRE(ma_s->prefix == 0x70b3d5abc000);
        REQUIRE(!ma_s->address);
    }

    SECTION("prefix separators, case and whitespace are ignored")
    {
        auto record = parse_record("  ac-de-48 ;  Example Corp  \r\n");
        REQUIRE(record);
        REQUIRE(record->prefix == 0xacde48000000);
        REQUIRE(record->organization == "Example Corp");

        auto colons = parse_record("AC:DE:48;Example Corp");
        REQUIRE(colons);
        REQUIRE(*colons == *record);
    }

    SECTION("IEEE CSV layout with registry name and quotes")
    {
        auto record = parse_record(
            "MA-L,ACDE48,\"Example, Inc.\",\"1 Way, Town  US 12345 \"",
            parse_options{','});
        REQUIRE(record);
        REQUIRE(record->width == prefix_width::ma_l);
        REQUIRE(record->organization == "Example, Inc.");
        REQUIRE(record->address
                == std::optional<std::string>("1 Way, Town  US 12345"));

        auto iab = parse_record("IAB,0050C2ABC,\"Quote \"\"Q\"\" Ltd\"",
                                parse_options{','});
        REQUIRE(iab);
        REQUIRE(iab->width == prefix_width::ma_s);
        REQUIRE(iab->organization == "Quote \"Q\" Ltd");

        REQUIRE(parse_failure("MA-S,ACDE48,Example", ',')
                == reason::width_mismatch);
    }

    SECTION("unquoted extra fields are folded into the address")
    {
        auto record =
            parse_record("ACDE48,Example,1 Way,Town,US", parse_options{','});
        REQUIRE(record);
        REQUIRE(record->address == std::optional<std::string>("1 Way,Town,US"));
    }

    SECTION("tab separated input")
    {
        auto record = parse_record("ACDE48\tExample\t", parse_options{'\t'});
        REQUIRE(record);
        REQUIRE(record->organization == "Example");
    }

    SECTION("malformed lines")
    {
        REQUIRE(parse_failure("") == reason::empty_line);
        REQUIRE(parse_failure("   \t") == reason::empty_line);
        REQUIRE(parse_failure("ACDE48") == reason::missing_field);
        REQUIRE(parse_failure("MA-L;ACDE48") == reason::missing_field);
        REQUIRE(parse_failure("Assignment;Organization Name")
                == reason::invalid_prefix);
        REQUIRE(parse_failure(";Example") == reason::invalid_prefix);
        REQUIRE(parse_failure("ACDG48;Example") == reason::invalid_prefix);
        REQUIRE(parse_failure("ACDE;Example") == reason::unsupported_width);
        REQUIRE(parse_failure("ACDE4800;Example") == reason::unsupported_width);
        REQUIRE(parse_failure("ACDE48000001;Example")
                == reason::unsupported_width);
        REQUIRE(parse_failure("ACDE48;  ;Somewhere")
                == reason::empty_organization);

        auto result = parse_record("ACDE;Example");
        REQUIRE(!result);
        REQUIRE(result.error().message.find("ACDE") != std::string::npos);
        REQUIRE(to_string(result.error().reason) == "unsupported prefix width");
    }

    SECTION("records print as prefix/width and organization")
    {
        REQUIRE(to_string(*parse_record("acde48;Example Corp"))
                == "ACDE48/24 Example Corp");
        REQUIRE(to_string(*parse_record("70b3d5abc;Small Org"))
                == "70B3D5ABC/36 Small Org");
        REQUIRE(to_string(*parse_record("0a0b0c1;Medium Org"))
                == "0A0B0C1/28 Medium Org");
    }
}
