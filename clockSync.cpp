#include "clockSync.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

std::int64_t wallClockMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

double clampPosition(double positionSeconds, std::optional<double> durationSeconds) {
    double clamped = std::max(0.0, positionSeconds);
    if (durationSeconds && *durationSeconds > 0.0) {
        clamped = std::min(clamped, *durationSeconds);
    }
    return clamped;
}

double extrapolatePosition(const PlaybackSnapshot& snapshot, std::int64_t nowMillis) {
    if (!snapshot.isPlaying) {
        return snapshot.positionSeconds;
    }
    // A snapshot stamped "in the future" (clock skew) is treated as fresh.
    std::int64_t elapsedMillis = std::max<std::int64_t>(0, nowMillis - snapshot.capturedAt);
    return snapshot.positionSeconds +
           (static_cast<double>(elapsedMillis) / 1000.0) * snapshot.speedMultiplier;
}

PlaybackSnapshot recapture(const PlaybackSnapshot& snapshot, std::int64_t nowMillis,
                           std::optional<double> durationSeconds) {
    PlaybackSnapshot current = snapshot;
    current.positionSeconds = clampPosition(extrapolatePosition(snapshot, nowMillis), durationSeconds);
    current.capturedAt = nowMillis;
    return current;
}

// ============================================================================
// DRIFT CORRECTOR
// ============================================================================

DriftCorrector::DriftCorrector(SyncThresholds thresholds) : thresholds_(thresholds) {}

Correction DriftCorrector::evaluate(const PlaybackSnapshot& snapshot, std::int64_t localNowMillis,
                                    double localPositionSeconds) const {
    Correction correction;
    correction.isPlaying = snapshot.isPlaying;
    correction.speedMultiplier = snapshot.speedMultiplier;
    correction.targetSeconds = extrapolatePosition(snapshot, localNowMillis);
    correction.driftSeconds = std::fabs(localPositionSeconds - correction.targetSeconds);

    if (correction.driftSeconds > thresholds_.hardSeconds) {
        correction.action = CorrectionAction::Snap;
    } else if (correction.driftSeconds > thresholds_.softSeconds) {
        correction.action = CorrectionAction::Seek;
    } else {
        correction.action = CorrectionAction::None;
    }
    return correction;
}

void DriftCorrector::apply(const Correction& correction, LocalPlayer& player) const {
    if (correction.speedMultiplier > 0.0 && player.speed() != correction.speedMultiplier) {
        player.setSpeed(correction.speedMultiplier);
    }

    // Snap and seek land on the same call; the distinction matters only to
    // renderers that want to mask the jump.
    if (correction.action != CorrectionAction::None) {
        player.seek(correction.targetSeconds);
    }

    if (correction.isPlaying && !player.isPlaying()) {
        player.play();
    } else if (!correction.isPlaying && player.isPlaying()) {
        player.pause();
    }
}
