#ifndef PARTICIPANT_HPP
#define PARTICIPANT_HPP

#include "protocol.hpp"

#include <memory>

/*
 * ============================================================================
 * PARTICIPANT - Anything That Can Receive Events
 * ============================================================================
 *
 * The Stage and the Lobby never see sockets. They hand events to a
 * Participant, and a network Connection is just one implementation of it
 * (tests plug in recorders). deliver() must return quickly: the caller may
 * be holding a stage lock, so implementations queue and return.
 * ============================================================================
 */

class Participant {
public:
    virtual void deliver(const Event& event) = 0;
    virtual ~Participant() = default;
};

typedef std::shared_ptr<Participant> ParticipantPtr;

#endif // PARTICIPANT_HPP
