#ifndef CLOCKSYNC_HPP
#define CLOCKSYNC_HPP

#include "model.hpp"

#include <cstdint>
#include <optional>

/*
 * ============================================================================
 * CLOCK SYNC - Extrapolation and Drift Correction
 * ============================================================================
 *
 * The host's position is only known "as of" the wall clock instant the
 * server captured it. Everybody else reconstructs the present from that:
 *
 *   target = position + (now - capturedAt) * speed     (while playing)
 *   target = position                                  (while paused)
 *
 * The audience then compares its own player against target:
 *
 *      0 ......... soft (0.3s) ......... hard (1.0s) ..........>  drift
 *      |  leave it alone  |   corrective seek   |   hard snap   |
 *
 * Play state and speed are mirrored on every evaluation, whatever the drift.
 * ============================================================================
 */

struct SyncThresholds {
    double softSeconds = 0.3;
    double hardSeconds = 1.0;
};

enum class CorrectionAction { None, Seek, Snap };

struct Correction {
    CorrectionAction action = CorrectionAction::None;
    double targetSeconds = 0.0;
    double driftSeconds = 0.0;
    bool isPlaying = false;
    double speedMultiplier = 1.0;
};

// Milliseconds since the Unix epoch from the system clock.
std::int64_t wallClockMillis();

// Clamp into [0, duration]; only the lower bound applies while duration is unknown.
double clampPosition(double positionSeconds, std::optional<double> durationSeconds);

double extrapolatePosition(const PlaybackSnapshot& snapshot, std::int64_t nowMillis);

// Same state, re-expressed as of nowMillis.
PlaybackSnapshot recapture(const PlaybackSnapshot& snapshot, std::int64_t nowMillis,
                           std::optional<double> durationSeconds);

/*
 * LocalPlayer - the client's own audio element, as seen by the sync code.
 * The client application implements it over whatever actually plays sound.
 */
class LocalPlayer {
public:
    // New track; the player starts paused at zero.
    virtual void load(const AudioSource& source) = 0;
    virtual double position() const = 0;
    virtual bool isPlaying() const = 0;
    virtual double speed() const = 0;
    virtual void seek(double positionSeconds) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void setSpeed(double speedMultiplier) = 0;
    virtual ~LocalPlayer() = default;
};

class DriftCorrector {
public:
    explicit DriftCorrector(SyncThresholds thresholds = SyncThresholds());

    Correction evaluate(const PlaybackSnapshot& snapshot, std::int64_t localNowMillis,
                        double localPositionSeconds) const;

    // Mirrors play state and speed, then seeks if the correction asks for it.
    void apply(const Correction& correction, LocalPlayer& player) const;

    const SyncThresholds& thresholds() const { return thresholds_; }

private:
    SyncThresholds thresholds_;
};

#endif // CLOCKSYNC_HPP
