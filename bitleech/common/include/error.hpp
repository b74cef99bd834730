#pragma once
#include <stdexcept>
#include <string>


namespace bitleech {

    enum class ErrorCode {
        // load-time parsing
        MalformedBencode,
        MissingField,
        InconsistentLength,
        MetainfoIo,

        // peer wire
        HandshakeMalformed,
        InfoHashMismatch,
        UnknownMessageId,
        MessageMalformed,
        BitfieldOutOfRange,
        ProtocolViolation,
        UnexpectedPiece,

        // session lifecycle
        TransportError,
        PeerStalled,
        PeerTimeout,
        NoMutualWork,

        // piece verification and storage
        PieceHashMismatch,
        StorageFailure,

        // swarm level
        SwarmCorrupt,
        SwarmExhausted,
        TrackerUnreachable,
        TrackerMalformed,
        TrackerFailure,

        InvalidConfig
    };

    const char* toString(ErrorCode code) noexcept;

    // A peer that produced one of these is dropped from the roster for good.
    bool isFatalForPeer(ErrorCode code) noexcept;


    struct Error 
    {
        ErrorCode code{ErrorCode::ProtocolViolation};
        std::string message;

        std::string describe() const { return std::string(toString(code)) + ": " + message; }
    };


    // Thrown by the load-time parsers (bencode, metainfo).
    class ParseError : public std::runtime_error 
    {
    public:
        ParseError(ErrorCode code, const std::string& what)
            : std::runtime_error(what), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace bitleech
