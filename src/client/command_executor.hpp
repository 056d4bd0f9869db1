#pragma once
#include <functional>
#include <vector>
#include "error.hpp"
#include "payload.hpp"
#include "protocol.hpp"
#include "session_selector.hpp"

namespace pcex {

// Maps a RESPONSE_ERROR packet to a remote-category Error, code and message verbatim.
Error remote_failure(const Packet& reply);

// Request/response over the active session.
class CommandExecutor {
public:
    template <typename T>
    using Parser = std::function<Result<T>(const std::vector<uint8_t>&)>;

    // Holds the session lease for a multi-packet flow such as a file transfer.
    class Exchange {
    public:
        Result<void> send(Command command, uint8_t flags, const std::vector<uint8_t>& payload);
        Result<Packet> receive();
        // One request and its reply. RESPONSE_OK and RESPONSE_DATA are returned;
        // RESPONSE_ERROR becomes a remote error, anything else unexpected_response.
        Result<Packet> call(Command command, const std::vector<uint8_t>& payload);

    private:
        friend class CommandExecutor;
        explicit Exchange(SessionSelector::Lease lease) : lease_(std::move(lease)) {}

        SessionSelector::Lease lease_;
    };

    explicit CommandExecutor(SessionSelector& sessions) : sessions_(sessions) {}

    Exchange open_exchange() { return Exchange(sessions_.lease()); }

    template <typename T>
    Result<T> execute(Command command, const std::vector<uint8_t>& payload, const Parser<T>& parse) {
        auto ex = open_exchange();
        auto reply = ex.call(command, payload);
        if (!reply)
            return reply.error();
        return parse(reply.value().payload);
    }

    // For commands whose reply carries nothing of interest.
    Result<void> execute(Command command, const std::vector<uint8_t>& payload);

private:
    SessionSelector& sessions_;
};

} // namespace pcex
