#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "catch2/catch.hpp"

#include "oui/lookup/engine.hpp"

using namespace liboui;

static constexpr std::string_view example_registry =
    "Assignment;Organization Name;Organization Address\n"
    "AC-DE-48;Example Corp;1 Example Way Springfield US\n"
    "70B3D5;IEEE Registration Authority;445 Hoes Lane Piscataway NJ US\n"
    "70B3D5ABC;Small Delegate;\n"
    "70B3D51;Medium Delegate;\n";

static registry::prefix_index make_index(std::string_view data)
{
    auto index = registry::load_string(data);
    REQUIRE(index);
    return (std::move(*index));
}

TEST_CASE("address resolution", "[liboui]")
{
    auto index = make_index(example_registry);

    SECTION("registered addresses resolve to their organization")
    {
        auto result = lookup::resolve(index, "AC:DE:48:11:22:33");
        REQUIRE(std::holds_alternative<lookup::resolved>(result));

        auto& hit = std::get<lookup::resolved>(result);
        REQUIRE(hit.organization == "Example Corp");
        REQUIRE(hit.matched_prefix_bits == 24);
        REQUIRE(hit.prefix == 0xacde48000000);
        REQUIRE(hit.registered_address
                == std::optional<std::string>("1 Example Way Springfield US"));
    }

    SECTION("sub-assignments take precedence over their block")
    {
        auto small = lookup::resolve(index, "70:b3:d5:ab:c1:23");
        REQUIRE(std::get<lookup::resolved>(small).organization
                == "Small Delegate");
        REQUIRE(std::get<lookup::resolved>(small).matched_prefix_bits == 36);
        REQUIRE(!std::get<lookup::resolved>(small).registered_address);

        auto medium = lookup::resolve(index, "70-B3-D5-1F-00-00");
        REQUIRE(std::get<lookup::resolved>(medium).organization
                == "Medium Delegate");
        REQUIRE(std::get<lookup::resolved>(medium).matched_prefix_bits == 28);

        auto large = lookup::resolve(index, "70b3d5000001");
        REQUIRE(std::get<lookup::resolved>(large).organization
                == "IEEE Registration Authority");
        REQUIRE(std::get<lookup::resolved>(large).matched_prefix_bits == 24);
    }

    SECTION("a zero padded MA-S prefix resolves to that record")
    {
        auto result = lookup::resolve(index, "70:B3:D5:AB:C0:00");
        REQUIRE(std::get<lookup::resolved>(result).organization
                == "Small Delegate");
        REQUIRE(std::get<lookup::resolved>(result).prefix == 0x70b3d5abc000);
    }

    SECTION("unregistered addresses are unresolved")
    {
        auto result = lookup::resolve(index, "00:11:22:33:44:55");
        REQUIRE(std::holds_alternative<lookup::unresolved>(result));
        REQUIRE(lookup::to_string(result) == "No match.");

        /* locally administered */
        REQUIRE(std::holds_alternative<lookup::unresolved>(
            lookup::resolve(index, "02:00:00:00:00:01")));
    }

    SECTION("malformed input is reported, never thrown")
    {
        for (auto text :
             {"not-a-mac",
              "",
              "AC:DE:48",
              "AC:DE:48:11:22:33:44",
              "zz",
              "1:2:3:4:5:6",
              "AC:DE-48:11:22:33"}) {
            lookup::lookup_result result;
            REQUIRE_NOTHROW(result = lookup::resolve(index, text));
            REQUIRE(
                std::holds_alternative<lookup::invalid_address_format>(result));
            REQUIRE(
                !std::get<lookup::invalid_address_format>(result).reason.empty());
        }
    }

    SECTION("delimiters do not change the outcome")
    {
        auto expected = lookup::resolve(index, "AC:DE:48:00:00:01");
        for (auto text : {"AC-DE-48-00-00-01", "acde48000001", "acde.4800.0001"}) {
            auto result = lookup::resolve(index, text);
            REQUIRE(std::get<lookup::resolved>(result).organization
                    == std::get<lookup::resolved>(expected).organization);
            REQUIRE(lookup::to_string(result) == lookup::to_string(expected));
        }
    }

    SECTION("repeated queries yield identical results")
    {
        auto first = lookup::to_string(lookup::resolve(index, "70b3d5abcfff"));
        for (int i = 0; i < 10; i++) {
            REQUIRE(lookup::to_string(lookup::resolve(index, "70b3d5abcfff"))
                    == first);
        }
        REQUIRE(first == "Small Delegate (/36)");
    }
}

TEST_CASE("lookup engine", "[liboui]")
{
    SECTION("engines without an index refuse queries")
    {
        auto engine = lookup::engine{};
        REQUIRE(!engine.ready());
        REQUIRE(!engine.index());
        REQUIRE_THROWS_AS(engine.resolve("AC:DE:48:11:22:33"),
                          lookup::index_not_ready);
    }

    SECTION("published indexes serve queries")
    {
        auto engine = lookup::engine(make_index(example_registry));
        REQUIRE(engine.ready());
        REQUIRE(engine.index()->size() == 4);

        auto result = engine.resolve("AC:DE:48:11:22:33");
        REQUIRE(std::get<lookup::resolved>(result).organization
                == "Example Corp");
    }

    SECTION("publishing replaces the index without disturbing holders")
    {
        auto engine = lookup::engine(make_index(example_registry));
        auto old_index = engine.index();

        engine.publish(std::make_shared<const registry::prefix_index>(
            make_index("ACDE48;Renamed Corp\n")));

        REQUIRE(std::get<lookup::resolved>(engine.resolve("acde48112233"))
                    .organization
                == "Renamed Corp");
        REQUIRE(std::holds_alternative<lookup::unresolved>(
            engine.resolve("70b3d5abc123")));

        /* The previous snapshot is still intact */
        REQUIRE(old_index->lookup(0x70b3d5abc123)->organization
                == "Small Delegate");
    }

    SECTION("reload keeps the current index on failure")
    {
        auto engine = lookup::engine(make_index(example_registry));

        auto result = engine.reload("/nonexistent/IEEE_OUI.csv");
        REQUIRE(!result);
        REQUIRE(result.error().reason
                == registry::load_error::reason_type::io_error);
        REQUIRE(std::holds_alternative<lookup::resolved>(
            engine.resolve("AC:DE:48:11:22:33")));
    }

    SECTION("reload publishes a freshly loaded registry")
    {
        std::string name = "/tmp/oui_engine_test-XXXXXX";
        auto fd = mkstemp(name.data());
        REQUIRE(fd != -1);
        close(fd);
        {
            std::ofstream output(name);
            output << "001122;Reloaded Corp\n";
        }

        auto engine = lookup::engine{};
        auto result = engine.reload(name);
        unlink(name.c_str());

        REQUIRE(result);
        REQUIRE(engine.ready());
        REQUIRE(std::get<lookup::resolved>(engine.resolve("00:11:22:33:44:55"))
                    .organization
                == "Reloaded Corp");
    }

    SECTION("concurrent readers share one index")
    {
        auto engine = lookup::engine(make_index(example_registry));
        constexpr int reader_count = 4;
        constexpr int query_count = 1000;

        std::vector<int> hits(reader_count, 0);
        std::vector<std::thread> readers;
        for (int r = 0; r < reader_count; r++) {
            readers.emplace_back([&, r]() {
                for (int q = 0; q < query_count; q++) {
                    auto result = engine.resolve("70:b3:d5:ab:c1:23");
                    if (std::holds_alternative<lookup::resolved>(result)) {
                        hits[r]++;
                    }
                }
            });
        }

        /* Swap in an equivalent index while the readers run */
        engine.publish(std::make_shared<const registry::prefix_index>(
            make_index(example_registry)));

        for (auto& reader : readers) { reader.join(); }
        for (auto count : hits) { REQUIRE(count == query_count); }
    }
}
