// Tests for the sequence id mixer: uniqueness of outstanding ids and
// exactly-once retrieval.

#include "server/sequence_id_mixer.hpp"

#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace test_sequence_id_mixer {

using Payload = std::pair<int, std::string>;

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

// Test: ids are non-zero and never repeat while outstanding, even for equal payloads.
static bool test_generated_ids_are_unique() {
    sequence_id_mixer::SequenceIdMixer<Payload> mixer;
    std::set<int64_t> seen;
    bool all_unique = true;
    bool none_zero = true;
    for (int index = 0; index < 1000; ++index) {
        // Every caller uses id 1, as independent sessions would.
        int64_t id = mixer.generate({1, "session-" + std::to_string(index % 3)});
        none_zero &= (id != 0);
        all_unique &= seen.insert(id).second;
    }
    bool passed = check(all_unique, "1000 outstanding ids are distinct");
    passed &= check(none_zero, "no generated id is zero");
    passed &= check(mixer.pending_count() == 1000, "every payload is pending");
    return passed;
}

// Test: take returns the payload once and nothing afterwards.
static bool test_take_is_exactly_once() {
    sequence_id_mixer::SequenceIdMixer<Payload> mixer;
    int64_t first = mixer.generate({7, "alpha"});
    int64_t second = mixer.generate({7, "beta"});

    auto taken = mixer.take(second);
    bool passed = check(taken.has_value() && taken->first == 7 && taken->second == "beta",
                        "first take returns the stored payload");
    passed &= check(!mixer.take(second).has_value(), "second take returns nothing");
    passed &= check(!mixer.take(second).has_value(), "third take returns nothing");
    passed &= check(mixer.take(first).has_value(), "other ids are unaffected");
    passed &= check(!mixer.take(12345).has_value(), "unknown id returns nothing");
    passed &= check(mixer.pending_count() == 0, "nothing left pending");
    return passed;
}

// Test: internal sequence numbers share the counter but register nothing.
static bool test_internal_sequence_numbers() {
    sequence_id_mixer::SequenceIdMixer<Payload> mixer;
    int64_t generated = mixer.generate({1, "alpha"});
    int64_t internal = mixer.next_sequence_number();
    int64_t after = mixer.generate({1, "beta"});

    bool passed = check(internal != generated && internal != after, "internal id collides with no mixed id");
    passed &= check(!mixer.take(internal).has_value(), "internal id has no payload");
    passed &= check(after > internal && internal > generated, "ids keep increasing");
    return passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_generated_ids_are_unique();
    all_passed &= test_take_is_exactly_once();
    all_passed &= test_internal_sequence_numbers();
    return all_passed;
}

} // namespace test_sequence_id_mixer
