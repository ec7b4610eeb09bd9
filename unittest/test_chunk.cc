#include <doctest/doctest.h>
#include <riff/chunk.hh>
#include <riff/exceptions.hh>

#include <type_traits>

#include "test_utils.hh"

using namespace riff;

namespace {
    // LIST/INFO with two leaves, then a nested LIST/adtl, inside RIFF/AVI
    container_chunk make_avi_like() {
        return container_chunk("RIFF"_4cc, "AVI "_4cc, {
            leaf_chunk("avih"_4cc, bytes_of({1, 2, 3, 4})),
            leaf_chunk("JUNK"_4cc, bytes_of({0})),
            container_chunk("LIST"_4cc, "INFO"_4cc, {
                leaf_chunk("INAM"_4cc, bytes_of("title")),
                container_chunk("LIST"_4cc, "adtl"_4cc, {})
            }),
            leaf_chunk("avih"_4cc, bytes_of({9}))
        });
    }
}

TEST_CASE("leaf chunk construction") {
    SUBCASE("fourcc id") {
        leaf_chunk leaf("data"_4cc, bytes_of({1, 2, 3}));
        CHECK(leaf.id() == "data"_4cc);
        CHECK(leaf.data().size() == 3);
        CHECK(leaf.data()[2] == std::byte{3});
    }

    SUBCASE("string id") {
        leaf_chunk leaf("fmt ", bytes_of({1, 2}));
        CHECK(leaf.id() == "fmt "_4cc);
    }

    SUBCASE("string id must be exactly 4 bytes") {
        CHECK_THROWS_AS(leaf_chunk("fmt", {}), invalid_chunk_error);
        CHECK_THROWS_AS(leaf_chunk("chunk", {}), invalid_chunk_error);
        CHECK_THROWS_AS(leaf_chunk("", {}), invalid_chunk_error);
    }

    SUBCASE("container keywords are rejected") {
        CHECK_THROWS_AS(leaf_chunk("RIFF"_4cc, {}), invalid_chunk_error);
        CHECK_THROWS_AS(leaf_chunk("LIST", bytes_of({1})), invalid_chunk_error);
    }

    SUBCASE("non-ascii ids are accepted") {
        leaf_chunk leaf(fourcc('\x00', '\x01', '\xfe', '\xff'), {});
        CHECK_FALSE(leaf.id().is_printable());
    }
}

TEST_CASE("container chunk construction") {
    SUBCASE("keyword ids") {
        container_chunk riff("RIFF"_4cc, "WAVE"_4cc, {});
        CHECK(riff.id() == "RIFF"_4cc);
        CHECK(riff.type() == "WAVE"_4cc);
        CHECK(riff.empty());

        container_chunk list("LIST", "INFO", {});
        CHECK(list.id() == "LIST"_4cc);
        CHECK(list.type() == "INFO"_4cc);
    }

    SUBCASE("non-keyword ids are rejected") {
        CHECK_THROWS_AS(container_chunk("data"_4cc, "WAVE"_4cc, {}), invalid_chunk_error);
        CHECK_THROWS_AS(container_chunk("RIFX", "WAVE", {}), invalid_chunk_error);
        CHECK_THROWS_AS(container_chunk("FORM", "AIFF", {}), invalid_chunk_error);
    }

    SUBCASE("ids must be exactly 4 bytes") {
        CHECK_THROWS_AS(container_chunk("RIF", "WAVE", {}), invalid_chunk_error);
        CHECK_THROWS_AS(container_chunk("RIFF", "WAV", {}), invalid_chunk_error);
        CHECK_THROWS_AS(container_chunk("LIST", "INFO!", {}), invalid_chunk_error);
    }

    SUBCASE("children keep insertion order") {
        auto avi = make_avi_like();
        REQUIRE(avi.count() == 4);
        CHECK(avi.get_by_index(0).id() == "avih"_4cc);
        CHECK(avi.get_by_index(1).id() == "JUNK"_4cc);
        CHECK(avi.get_by_index(2).id() == "LIST"_4cc);
        CHECK(avi.get_by_index(3).id() == "avih"_4cc);

        std::vector<fourcc> ids;
        for (const auto& child : avi) {
            ids.push_back(child.id());
        }
        CHECK((ids == std::vector<fourcc>{"avih"_4cc, "JUNK"_4cc, "LIST"_4cc, "avih"_4cc}));
    }
}

TEST_CASE("chunk size") {
    SUBCASE("empty leaf") {
        leaf_chunk leaf("data"_4cc, {});
        CHECK(leaf.declared_length() == 0);
        CHECK(leaf.size() == 8);
    }

    SUBCASE("odd leaf gets one padding byte") {
        leaf_chunk leaf("data"_4cc, bytes_of({1, 2, 3}));
        CHECK(leaf.declared_length() == 3);
        CHECK(leaf.size() == 12);
    }

    SUBCASE("even leaf") {
        leaf_chunk leaf("data"_4cc, bytes_of({1, 2, 3, 4}));
        CHECK(leaf.declared_length() == 4);
        CHECK(leaf.size() == 12);
    }

    SUBCASE("empty container holds only its type") {
        container_chunk list("LIST"_4cc, "INFO"_4cc, {});
        CHECK(list.declared_length() == 4);
        CHECK(list.size() == 12);
    }

    SUBCASE("container counts padded children") {
        container_chunk riff("RIFF"_4cc, "WAVE"_4cc, {
            leaf_chunk("data"_4cc, bytes_of({1, 2, 3}))
        });
        CHECK(riff.declared_length() == 4 + 12);
        CHECK(riff.size() == 24);
    }

    SUBCASE("sizes are always even") {
        for (std::size_t n = 0; n < 9; n++) {
            leaf_chunk leaf("test"_4cc, std::vector<std::byte>(n, std::byte{0x55}));
            CHECK(leaf.size() % 2 == 0);
            CHECK(leaf.size() == 8 + n + (n % 2));
        }
        chunk avi = make_avi_like();
        CHECK(avi.size() % 2 == 0);
    }

    SUBCASE("nested sizes add up") {
        chunk avi = make_avi_like();
        // avih 12 + JUNK 10 + LIST(INAM 14 + LIST 12 -> 12 + 26 = 38) + avih 10
        CHECK(avi.declared_length() == 4 + 12 + 10 + 38 + 10);
        CHECK(avi.size() == 8 + 74);
    }
}

TEST_CASE("chunk lookup") {
    container_chunk riff("RIFF"_4cc, "WAVE"_4cc, {
        leaf_chunk("A   "_4cc, bytes_of({1})),
        leaf_chunk("B   "_4cc, bytes_of({2})),
        container_chunk("LIST"_4cc, "C   "_4cc, {
            leaf_chunk("A   "_4cc, bytes_of({3}))
        }),
        leaf_chunk("A   "_4cc, bytes_of({4}))
    });

    SUBCASE("by name returns the first match") {
        const auto& a = riff.get_by_name("A   "_4cc);
        REQUIRE(a.leaf() != nullptr);
        CHECK(a.as_leaf().data()[0] == std::byte{1});
        CHECK(riff.get_by_name("B   "_4cc).as_leaf().data()[0] == std::byte{2});
    }

    SUBCASE("nested container by its type") {
        const auto& c = riff.get_by_name("C   "_4cc);
        REQUIRE(c.is_container());
        CHECK(c.as_container().type() == "C   "_4cc);
        CHECK(&c == &riff.get_by_index(2));
    }

    SUBCASE("nested container by its keyword") {
        CHECK(&riff.get_by_name("LIST"_4cc) == &riff.get_by_index(2));
    }

    SUBCASE("lookup does not descend into grandchildren") {
        CHECK(&riff.get_by_name("A   "_4cc) == &riff.get_by_index(0));
    }

    SUBCASE("missing name") {
        CHECK_THROWS_AS(riff.get_by_name("Z   "_4cc), key_not_found_error);
        CHECK_THROWS_AS(riff.get_by_name("WAVE"_4cc), lookup_error);
        CHECK(riff.find("Z   "_4cc) == nullptr);
        CHECK(riff.find("B   "_4cc) == &riff.get_by_index(1));
    }

    SUBCASE("index out of range") {
        CHECK_NOTHROW((void)riff.get_by_index(3));
        CHECK_THROWS_AS(riff.get_by_index(4), index_out_of_range_error);
        CHECK_THROWS_AS(container_chunk("LIST"_4cc, "INFO"_4cc, {}).get_by_index(0), lookup_error);
    }

    SUBCASE("nested LIST in LIST by index and by type") {
        container_chunk outer("LIST"_4cc, "outr"_4cc, {
            container_chunk("LIST"_4cc, "innr"_4cc, {
                leaf_chunk("leaf"_4cc, bytes_of("x"))
            })
        });
        const auto& by_index = outer.get_by_index(0);
        const auto& by_name = outer.get_by_name("innr"_4cc);
        CHECK(&by_index == &by_name);
        CHECK(by_name.as_container().get_by_name("leaf"_4cc).as_leaf().data().size() == 1);
    }
}

TEST_CASE("chunk variant access") {
    chunk leaf = leaf_chunk("data"_4cc, bytes_of({1}));
    chunk list = container_chunk("LIST"_4cc, "INFO"_4cc, {});

    CHECK_FALSE(leaf.is_container());
    CHECK(leaf.leaf() != nullptr);
    CHECK(leaf.container() == nullptr);
    CHECK_THROWS_AS((void)leaf.as_container(), invalid_chunk_error);

    CHECK(list.is_container());
    CHECK(list.leaf() == nullptr);
    CHECK(list.id() == "LIST"_4cc);
    CHECK_THROWS_AS((void)list.as_leaf(), invalid_chunk_error);

    int leaves = 0;
    int containers = 0;
    for (const chunk* c : {&leaf, &list}) {
        c->visit([&](const auto& v) {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, leaf_chunk>) {
                leaves++;
            } else {
                containers++;
            }
        });
    }
    CHECK(leaves == 1);
    CHECK(containers == 1);
}

TEST_CASE("chunk equality") {
    CHECK(chunk(make_avi_like()) == chunk(make_avi_like()));

    CHECK(leaf_chunk("data"_4cc, bytes_of({1})) != leaf_chunk("data"_4cc, bytes_of({2})));
    CHECK(leaf_chunk("data"_4cc, bytes_of({1})) != leaf_chunk("date"_4cc, bytes_of({1})));

    CHECK(container_chunk("LIST"_4cc, "INFO"_4cc, {}) != container_chunk("LIST"_4cc, "adtl"_4cc, {}));
    CHECK(container_chunk("LIST"_4cc, "INFO"_4cc, {}) != container_chunk("RIFF"_4cc, "INFO"_4cc, {}));

    chunk leaf = leaf_chunk("INFO"_4cc, {});
    chunk list = container_chunk("LIST"_4cc, "INFO"_4cc, {});
    CHECK(leaf != list);
}
