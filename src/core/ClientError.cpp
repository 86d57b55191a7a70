#include "pixelair/core/ClientError.hpp"

namespace pixelair {

namespace {

class ClientCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "pixelair"; }

    std::string message(int value) const override {
        switch (static_cast<ClientErrc>(value)) {
            case ClientErrc::MalformedPacket: return "malformed packet";
            case ClientErrc::UnknownDevice:   return "unknown device";
            case ClientErrc::CommandTimeout:  return "command not confirmed by device";
            case ClientErrc::Socket:          return "socket error";
            case ClientErrc::NotRunning:      return "client not acquired";
        }
        return "unknown pixelair error";
    }
};

} // namespace

const std::error_category& clientCategory() noexcept {
    static const ClientCategory category;
    return category;
}

std::error_code make_error_code(ClientErrc errc) noexcept {
    return {static_cast<int>(errc), clientCategory()};
}

} // namespace pixelair
