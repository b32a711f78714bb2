#include "fake_imagery_service.hpp"

#include "pan_series/catalog/catalog_resolver.hpp"
#include "pan_series/catalog/collection_adapter.hpp"
#include "pan_series/service/retry.hpp"

#include <memory>

#include <catch2/catch_test_macros.hpp>

using namespace pan_series;
using pan_series::testing::FakeImageryService;
using pan_series::testing::collection;
using pan_series::testing::fast_retry;

namespace {

model::CatalogFilter mozambique_filter() {
    return model::CatalogFilter(model::Provider::AIRBUS, BBox{36.83, -17.7, 36.90, -17.6},
                                {{"constellation", "PHR"}});
}

} // namespace

TEST_CASE("catalog_resolver_follows_pages_and_deduplicates") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->pages[""] = {{collection("a", "Alpha"), collection("b", "Beta")}, "t1"};
    fake->pages["t1"] = {{collection("b", "Beta"), collection("c", "Gamma")}, ""};

    catalog::CatalogResolver resolver(fake, fast_retry());
    const auto out = resolver.resolve(mozambique_filter());

    REQUIRE(out.size() == 3);
    REQUIRE(out[0].id == "a");
    REQUIRE(out[1].id == "b");
    REQUIRE(out[2].id == "c");
    REQUIRE(fake->search_calls.load() == 2);
}

TEST_CASE("catalog_resolver_returns_empty_list_when_nothing_matches") {
    auto fake = std::make_shared<FakeImageryService>();
    catalog::CatalogResolver resolver(fake, fast_retry());
    REQUIRE(resolver.resolve(mozambique_filter()).empty());
}

TEST_CASE("catalog_resolver_stops_on_repeated_token_and_page_limit") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->pages[""] = {{collection("a", "Alpha")}, "loop"};
    fake->pages["loop"] = {{collection("b", "Beta")}, "loop"};

    catalog::CatalogResolver resolver(fake, fast_retry());
    REQUIRE(resolver.resolve(mozambique_filter()).size() == 2);
    REQUIRE(fake->search_calls.load() == 2);

    fake->search_calls = 0;
    catalog::CatalogResolver one_page(fake, fast_retry(), 1);
    REQUIRE(one_page.resolve(mozambique_filter()).size() == 1);
    REQUIRE(fake->search_calls.load() == 1);
}

TEST_CASE("catalog_resolver_retries_transient_failures") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->pages[""] = {{collection("a", "Alpha")}, ""};
    fake->transient_search_failures = 2;

    catalog::CatalogResolver resolver(fake, fast_retry(3));
    REQUIRE(resolver.resolve(mozambique_filter()).size() == 1);
    REQUIRE(fake->search_calls.load() == 3);
}

TEST_CASE("catalog_resolver_surfaces_exhausted_retries_as_unavailable") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->catalog_always_unavailable = true;

    catalog::CatalogResolver resolver(fake, fast_retry(4));
    try {
        resolver.resolve(mozambique_filter());
        FAIL("expected CatalogUnavailableError");
    } catch (const CatalogUnavailableError& e) {
        REQUIRE(e.context().bbox.has_value());
    }
    REQUIRE(fake->search_calls.load() == 4);
}

TEST_CASE("catalog_resolver_does_not_retry_rejected_credentials") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->reject_credentials = true;

    catalog::CatalogResolver resolver(fake, fast_retry(4));
    REQUIRE_THROWS_AS(resolver.resolve(mozambique_filter()), AuthError);
    REQUIRE(fake->search_calls.load() == 1);
}

TEST_CASE("rejected_credentials_keep_a_single_message_prefix") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->reject_credentials = true;
    fake->collections["pleiades"] = testing::make_descriptor("pleiades", {"PAN"});

    try {
        catalog::CatalogResolver(fake, fast_retry()).resolve(mozambique_filter());
        FAIL("expected AuthError");
    } catch (const AuthError& e) {
        REQUIRE(e.detail() == "invalid client");
        REQUIRE(std::string(e.what()).rfind("Auth error: invalid client", 0) == 0);
        REQUIRE(e.context().bbox.has_value());
    }

    try {
        catalog::CollectionAdapter(fake, fast_retry()).resolve("pleiades");
        FAIL("expected AuthError");
    } catch (const AuthError& e) {
        REQUIRE(std::string(e.what()).find("Auth error: Auth error") == std::string::npos);
        REQUIRE(e.context().collection_id == "pleiades");
    }
}

TEST_CASE("select_collection_matches_by_name") {
    const std::vector<model::Collection> list{collection("a", "Alpha"), collection("b", "Pleiades Mozambique")};
    REQUIRE(catalog::select_collection(list, "").id == "a");
    REQUIRE(catalog::select_collection(list, "Pleiades Mozambique").id == "b");
    REQUIRE(catalog::select_collection(list, "pleiades mozambique").id == "b");
    REQUIRE_THROWS_AS(catalog::select_collection(list, "Nope"), CollectionNotFoundError);
    REQUIRE_THROWS_AS(catalog::select_collection({}, ""), CollectionNotFoundError);
}

TEST_CASE("collection_adapter_binds_band_metadata") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->collections["abc"] = testing::make_descriptor("abc", {"B0", "B1", "B2", "B3", "PAN"});

    catalog::CollectionAdapter adapter(fake, fast_retry());
    const model::Product p = adapter.resolve("abc");
    REQUIRE(p.collection_id == "abc");
    REQUIRE(p.bands.size() == 5);
    REQUIRE(p.find_band("PAN") != nullptr);
    REQUIRE(p.temporal_extent.start == make_date(2020, 1, 1));
}

TEST_CASE("collection_adapter_reports_unknown_ids") {
    auto fake = std::make_shared<FakeImageryService>();
    fake->collections["empty"] = testing::make_descriptor("empty", {});
    fake->collections["dup"] = testing::make_descriptor("dup", {"B0", "B0"});

    catalog::CollectionAdapter adapter(fake, fast_retry());
    try {
        adapter.resolve("missing");
        FAIL("expected CollectionNotFoundError");
    } catch (const CollectionNotFoundError& e) {
        REQUIRE(e.context().collection_id == "missing");
    }
    REQUIRE_THROWS_AS(adapter.resolve(""), CollectionNotFoundError);
    REQUIRE_THROWS_AS(adapter.resolve("empty"), CollectionNotFoundError);
    REQUIRE_THROWS_AS(adapter.resolve("dup"), CollectionNotFoundError);
}

TEST_CASE("retry_backoff_grows_and_is_capped") {
    service::RetryPolicy p;
    p.initial_backoff = std::chrono::milliseconds(100);
    p.max_backoff = std::chrono::milliseconds(350);
    p.multiplier = 2.0;
    REQUIRE(p.backoff_after(1).count() == 100);
    REQUIRE(p.backoff_after(2).count() == 200);
    REQUIRE(p.backoff_after(3).count() == 350);
}

TEST_CASE("with_retry_only_retries_transient_transport_errors") {
    int calls = 0;
    int attempts = 0;
    const int value = service::with_retry(fast_retry(3), [&]() {
        if (++calls < 3) {
            throw TransportError("timeout", 0, true);
        }
        return 42;
    }, nullptr, &attempts);
    REQUIRE(value == 42);
    REQUIRE(attempts == 3);

    calls = 0;
    REQUIRE_THROWS_AS(service::with_retry(fast_retry(3), [&]() -> int {
        ++calls;
        throw TransportError("not found", 404, false);
    }), TransportError);
    REQUIRE(calls == 1);

    calls = 0;
    std::atomic<bool> stop{true};
    REQUIRE_THROWS_AS(service::with_retry(fast_retry(5), [&]() -> int {
        ++calls;
        throw TransportError("timeout", 0, true);
    }, &stop), TransportError);
    REQUIRE(calls == 1);
}
