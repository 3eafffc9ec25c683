/**
 * @file events.hpp
 * @brief Per-step event channel with independent reader cursors
 *
 * Producers append events with send(). Each consumer owns a ReaderId
 * obtained from registerReader() during setup; read() returns every event
 * the reader has not seen yet and advances only that reader's cursor, so
 * any number of consumers observe the same events without stealing them
 * from each other.
 *
 * update() clears the buffer. The game runs it once at the start of every
 * step, so an event is visible from the moment it is sent until the next
 * step begins. Consumers must run after the producer in the same step.
 */

#ifndef BYTEPATH_EVENTS_HPP
#define BYTEPATH_EVENTS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>
#include "bytepath/math/vector_math.hpp"

/**
 * @enum GameEventType
 * @brief Cross-cutting domain events
 */
enum class GameEventType {
    PlayerDeath,
    PlayerSpawn,
    ProjectileDeath
};

struct GameEvent {
    GameEventType type;
    Vector position;
};

/**
 * @brief Handle to a reader cursor. Default-constructed handles are invalid.
 */
struct ReaderId {
    std::size_t index = std::numeric_limits<std::size_t>::max();

    bool valid() const { return index != std::numeric_limits<std::size_t>::max(); }
};

template <typename Event>
class EventChannel {
public:
    /**
     * @brief Registers a new consumer. Its cursor starts at the current end
     *        of the buffer, so it only sees events sent after registration.
     */
    ReaderId registerReader() {
        ReaderId id;
        id.index = cursors.size();
        cursors.push_back(nextSequence);
        return id;
    }

    void send(const Event& event) {
        buffer.push_back(Stored{nextSequence++, event});
    }

    /**
     * @brief Returns all events the reader has not seen and marks them read
     * @throws std::logic_error if the reader was never registered
     */
    std::vector<Event> read(const ReaderId& reader) {
        auto& cursor = cursorFor(reader);
        std::vector<Event> unread;
        for (const auto& stored : buffer) {
            if (stored.sequence >= cursor) {
                unread.push_back(stored.event);
            }
        }
        cursor = nextSequence;
        return unread;
    }

    /**
     * @brief Number of events the reader would get from read()
     * @throws std::logic_error if the reader was never registered
     */
    std::size_t unreadCount(const ReaderId& reader) const {
        std::uint64_t const cursor = cursors.at(checkedIndex(reader));
        std::size_t count = 0;
        for (const auto& stored : buffer) {
            if (stored.sequence >= cursor) {
                ++count;
            }
        }
        return count;
    }

    /**
     * @brief Drops every buffered event. Cursors keep their positions.
     */
    void update() { buffer.clear(); }

    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }
    std::size_t readerCount() const { return cursors.size(); }

private:
    struct Stored {
        std::uint64_t sequence;
        Event event;
    };

    std::size_t checkedIndex(const ReaderId& reader) const {
        if (!reader.valid() || reader.index >= cursors.size()) {
            throw std::logic_error("EventChannel: read with an unregistered reader");
        }
        return reader.index;
    }

    std::uint64_t& cursorFor(const ReaderId& reader) {
        return cursors[checkedIndex(reader)];
    }

    std::vector<Stored> buffer;
    std::vector<std::uint64_t> cursors;
    std::uint64_t nextSequence = 0;
};

#endif // BYTEPATH_EVENTS_HPP
