/**
 * test_voice_catalog.cpp - Display identifiers and lookups
 */

#include "ttsr/tts/VoiceCatalog.hpp"

#include <cassert>
#include <iostream>

using namespace ttsr::tts;

static VoiceCatalog makeCatalog() {
    return VoiceCatalog({
        Voice{"Alice", "en", "alice"},
        Voice{"Bob", "fr", "bob"},
        Voice{"Alice", "en", "alice-2"}
    });
}

void test_display_name() {
    assert(displayName(Voice{"Alice", "en", "alice"}) == "Alice [en]");
    assert(displayName(Voice{"mb-de1", "", "mb-de1"}) == "mb-de1 []");

    std::cout << "[PASS] test_display_name" << std::endl;
}

void test_lookup_by_index_and_name() {
    VoiceCatalog catalog = makeCatalog();
    assert(catalog.size() == 3);
    assert(!catalog.empty());

    for (size_t i = 0; i < 2; ++i) {
        std::string name = catalog.nameAt(i);
        auto index = catalog.indexOf(name);
        assert(index && *index == i);
        assert(catalog.findByName(name) != nullptr);
    }

    const Voice* bob = catalog.findByName("Bob [fr]");
    assert(bob && bob->handle == "bob");

    std::cout << "[PASS] test_lookup_by_index_and_name" << std::endl;
}

void test_duplicate_name_resolves_to_first() {
    VoiceCatalog catalog = makeCatalog();
    const Voice* alice = catalog.findByName("Alice [en]");
    assert(alice && alice->handle == "alice");
    assert(*catalog.indexOf("Alice [en]") == 0);

    std::cout << "[PASS] test_duplicate_name_resolves_to_first" << std::endl;
}

void test_unknown_and_out_of_range() {
    VoiceCatalog catalog = makeCatalog();
    assert(catalog.findByName("Eve [xx]") == nullptr);
    assert(!catalog.indexOf("Eve [xx]"));
    assert(!catalog.indexOf(""));
    assert(catalog.nameAt(3).empty());
    assert(catalog.nameAt(static_cast<size_t>(-1)).empty());

    VoiceCatalog none;
    assert(none.empty());
    assert(none.nameAt(0).empty());
    assert(none.names().empty());

    std::cout << "[PASS] test_unknown_and_out_of_range" << std::endl;
}

void test_names_in_order() {
    auto names = makeCatalog().names();
    assert(names.size() == 3);
    assert(names[0] == "Alice [en]");
    assert(names[1] == "Bob [fr]");
    assert(names[2] == "Alice [en]");

    std::cout << "[PASS] test_names_in_order" << std::endl;
}

int main() {
    std::cout << "=== VoiceCatalog Tests ===" << std::endl;

    test_display_name();
    test_lookup_by_index_and_name();
    test_duplicate_name_resolves_to_first();
    test_unknown_and_out_of_range();
    test_names_in_order();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
