#ifndef PLAYQUEUE_HPP
#define PLAYQUEUE_HPP

#include "model.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

/*
 * ============================================================================
 * PLAY QUEUE - Locked Head, Reorderable Tail, One Pending Suggestion Each
 * ============================================================================
 *
 *   items_:  [ playing? | next | next ] [ later | later | later ... ]
 *             \________ locked head ___/ \______ reorderable tail ____/
 *              positions 0 .. K-1          positions K .. n-1
 *
 * Only non-played items live in items_; a finished track moves to history_.
 * When something is playing it sits at position 0. The head changes only by
 * append (when the queue is short), removal and advance; reorder() touches
 * nothing but the tail.
 *
 * The queue knows nothing about roles. The SessionView in front of it decides
 * who may call what; this class only guards its own invariants.
 * ============================================================================
 */

struct TrackRequest {
    std::string title;
    std::string source;
    std::string url;
};

class PlayQueue {
public:
    static const size_t defaultLockedHeadSize = 3;
    static const size_t historyLimit = 20;

    explicit PlayQueue(size_t lockedHeadSize = defaultLockedHeadSize);

    // ========================================================================
    // QUEUE
    // ========================================================================

    const QueueItem& enqueue(const TrackRequest& track, const std::string& memberId,
                             const std::string& memberName);

    void updateItem(const std::string& itemId, QueueStatus status, const json& analysisResult);

    // Throws InvalidOrder unless tailOrder is a permutation of the tail ids.
    void reorder(const std::vector<std::string>& tailOrder);

    // Removing the playing item advances; the newly playing item is returned.
    std::optional<QueueItem> remove(const std::string& itemId);

    // Finishes the playing item and starts the next one, if any.
    std::optional<QueueItem> advance();

    // ========================================================================
    // SUGGESTIONS
    // ========================================================================

    const Suggestion& suggest(const TrackRequest& track, const std::string& memberId,
                              const std::string& memberName);

    // Resolves and deletes the suggestion; returns it with its final status.
    Suggestion respond(const std::string& suggestionId, bool approve);

    bool hasPendingFrom(const std::string& memberId) const;

    // ========================================================================
    // VIEWS
    // ========================================================================

    const std::vector<QueueItem>& items() const { return items_; }
    std::vector<QueueItem> head() const;
    std::vector<QueueItem> tail() const;
    std::vector<QueueItem> history() const;
    const std::vector<Suggestion>& suggestions() const { return suggestions_; }
    std::optional<QueueItem> playing() const;

private:
    void renumber();
    std::vector<QueueItem>::iterator findItem(const std::string& itemId);

    size_t lockedHeadSize_;
    std::vector<QueueItem> items_;
    std::deque<QueueItem> history_;
    std::vector<Suggestion> suggestions_;
};

#endif // PLAYQUEUE_HPP
