#include "playQueue.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>

namespace {

TrackRequest validated(const TrackRequest& track) {
    if (track.url.empty()) {
        throw StageError(ErrorKind::InvalidArgument, "Track url is required");
    }
    TrackRequest clean = track;
    if (clean.title.empty()) {
        clean.title = clean.url;
    }
    return clean;
}

}  // namespace

PlayQueue::PlayQueue(size_t lockedHeadSize) : lockedHeadSize_(lockedHeadSize) {}

// ============================================================================
// QUEUE
// ============================================================================

const QueueItem& PlayQueue::enqueue(const TrackRequest& track, const std::string& memberId,
                                    const std::string& memberName) {
    TrackRequest clean = validated(track);

    QueueItem item;
    item.id = newId();
    item.title = clean.title;
    item.source = clean.source;
    item.url = clean.url;
    item.status = QueueStatus::Pending;
    item.addedByMemberId = memberId;
    item.addedByName = memberName;
    item.position = items_.size();
    items_.push_back(item);
    return items_.back();
}

void PlayQueue::updateItem(const std::string& itemId, QueueStatus status, const json& analysisResult) {
    if (status == QueueStatus::Playing || status == QueueStatus::Played) {
        throw StageError(ErrorKind::InvalidArgument, "Only advance may start or finish an item");
    }
    auto it = findItem(itemId);
    if (it == items_.end()) {
        throw StageError(ErrorKind::NotFound, "Queue item not found");
    }
    if (it->status == QueueStatus::Playing) {
        throw StageError(ErrorKind::InvalidArgument, "Item is already playing");
    }
    it->status = status;
    if (!analysisResult.is_null()) {
        it->analysisResult = analysisResult;
    }
}

void PlayQueue::reorder(const std::vector<std::string>& tailOrder) {
    size_t headEnd = std::min(lockedHeadSize_, items_.size());
    size_t tailSize = items_.size() - headEnd;

    if (tailOrder.size() != tailSize) {
        throw StageError(ErrorKind::InvalidOrder, "Order must list every tail item exactly once");
    }

    std::set<std::string> expected;
    for (size_t i = headEnd; i < items_.size(); ++i) {
        expected.insert(items_[i].id);
    }
    std::set<std::string> given(tailOrder.begin(), tailOrder.end());
    if (given.size() != tailOrder.size() || given != expected) {
        throw StageError(ErrorKind::InvalidOrder, "Order must list every tail item exactly once");
    }

    std::vector<QueueItem> reordered(items_.begin(), items_.begin() + headEnd);
    reordered.reserve(items_.size());
    for (const auto& id : tailOrder) {
        reordered.push_back(*findItem(id));
    }
    items_.swap(reordered);
    renumber();
}

std::optional<QueueItem> PlayQueue::remove(const std::string& itemId) {
    auto it = findItem(itemId);
    if (it == items_.end()) {
        throw StageError(ErrorKind::NotFound, "Queue item not found");
    }

    bool wasPlaying = it->status == QueueStatus::Playing;
    items_.erase(it);
    renumber();

    if (!wasPlaying || items_.empty()) {
        return std::nullopt;
    }
    // Skip forward: the removed track is gone for good, not moved to history.
    items_.front().status = QueueStatus::Playing;
    return items_.front();
}

std::optional<QueueItem> PlayQueue::advance() {
    if (!items_.empty() && items_.front().status == QueueStatus::Playing) {
        QueueItem finished = items_.front();
        finished.status = QueueStatus::Played;
        history_.push_back(finished);
        if (history_.size() > historyLimit) {
            history_.pop_front();
        }
        items_.erase(items_.begin());
        renumber();
    }

    if (items_.empty()) {
        return std::nullopt;
    }
    items_.front().status = QueueStatus::Playing;
    return items_.front();
}

// ============================================================================
// SUGGESTIONS
// ============================================================================

const Suggestion& PlayQueue::suggest(const TrackRequest& track, const std::string& memberId,
                                     const std::string& memberName) {
    if (hasPendingFrom(memberId)) {
        throw StageError(ErrorKind::DuplicatePending, "You already have a pending suggestion");
    }
    TrackRequest clean = validated(track);

    Suggestion suggestion;
    suggestion.id = newId();
    suggestion.title = clean.title;
    suggestion.source = clean.source;
    suggestion.url = clean.url;
    suggestion.proposerMemberId = memberId;
    suggestion.proposerName = memberName;
    suggestion.status = SuggestionStatus::Pending;
    suggestions_.push_back(suggestion);
    return suggestions_.back();
}

Suggestion PlayQueue::respond(const std::string& suggestionId, bool approve) {
    auto it = std::find_if(suggestions_.begin(), suggestions_.end(),
                           [&](const Suggestion& s) { return s.id == suggestionId; });
    if (it == suggestions_.end()) {
        throw StageError(ErrorKind::NotFound, "Suggestion not found");
    }

    Suggestion resolved = *it;
    suggestions_.erase(it);
    resolved.status = approve ? SuggestionStatus::Approved : SuggestionStatus::Rejected;

    if (approve) {
        TrackRequest track{resolved.title, resolved.source, resolved.url};
        enqueue(track, resolved.proposerMemberId, resolved.proposerName);
    }
    return resolved;
}

bool PlayQueue::hasPendingFrom(const std::string& memberId) const {
    return std::any_of(suggestions_.begin(), suggestions_.end(), [&](const Suggestion& s) {
        return s.proposerMemberId == memberId && s.status == SuggestionStatus::Pending;
    });
}

// ============================================================================
// VIEWS
// ============================================================================

std::vector<QueueItem> PlayQueue::head() const {
    size_t headEnd = std::min(lockedHeadSize_, items_.size());
    return std::vector<QueueItem>(items_.begin(), items_.begin() + headEnd);
}

std::vector<QueueItem> PlayQueue::tail() const {
    size_t headEnd = std::min(lockedHeadSize_, items_.size());
    return std::vector<QueueItem>(items_.begin() + headEnd, items_.end());
}

std::vector<QueueItem> PlayQueue::history() const {
    return std::vector<QueueItem>(history_.begin(), history_.end());
}

std::optional<QueueItem> PlayQueue::playing() const {
    if (!items_.empty() && items_.front().status == QueueStatus::Playing) {
        return items_.front();
    }
    return std::nullopt;
}

void PlayQueue::renumber() {
    for (size_t i = 0; i < items_.size(); ++i) {
        items_[i].position = i;
    }
}

std::vector<QueueItem>::iterator PlayQueue::findItem(const std::string& itemId) {
    return std::find_if(items_.begin(), items_.end(),
                        [&](const QueueItem& item) { return item.id == itemId; });
}
