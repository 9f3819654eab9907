#ifndef WKMUX_SEQUENCE_ID_MIXER_HPP
#define WKMUX_SEQUENCE_ID_MIXER_HPP

// Maps ids chosen independently by many callers onto the single flat id
// space of the browser pipe. Every generated id is handed back exactly once.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>

namespace sequence_id_mixer {

template <typename Payload>
class SequenceIdMixer {
public:
    // Mint a fresh id and remember payload under it.
    int64_t generate(Payload payload) {
        int64_t sequence_number = next_sequence_number();
        pending_.emplace(sequence_number, std::move(payload));
        return sequence_number;
    }

    // First call for an id returns its payload and forgets it; later calls
    // (duplicate or late responses) return nullopt.
    std::optional<Payload> take(int64_t sequence_number) {
        auto pending_iterator = pending_.find(sequence_number);
        if (pending_iterator == pending_.end()) {
            return std::nullopt;
        }
        Payload payload = std::move(pending_iterator->second);
        pending_.erase(pending_iterator);
        return payload;
    }

    // Mint an id from the same counter without registering a payload.
    // Used for internally issued requests whose responses are dropped.
    int64_t next_sequence_number() {
        return ++last_sequence_number_;
    }

    size_t pending_count() const { return pending_.size(); }

    void clear() { pending_.clear(); }

private:
    int64_t last_sequence_number_ = 0;
    std::unordered_map<int64_t, Payload> pending_;
};

} // namespace sequence_id_mixer

#endif // WKMUX_SEQUENCE_ID_MIXER_HPP
