#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "cop/core/errors.hpp"
#include "cop/security/asymmetric.hpp"

namespace cop::identity {

    // Public half of a party as seen by the protocol.
    struct PartyKeys {
        std::string id;
        cop::security::SigningPublicKey signing{};
        cop::security::EncPublicKey encryption{};
    };

    // Party ids: 1..64 chars of [A-Za-z0-9._-], not starting with '.'.
    // They appear in file names and associated data, so the alphabet is closed.
    [[nodiscard]] bool party_id_valid(std::string_view id) noexcept;

    class IdentityRegistry {
    public:
        virtual ~IdentityRegistry() = default;

        // NotFound when the party is unknown.
        virtual cop::core::Status get_public_keys(std::string_view party_id, PartyKeys* out) const noexcept = 0;
    };

    class MemoryRegistry final : public IdentityRegistry {
    public:
        // Replaces any earlier entry for the same id.
        cop::core::Status put(const PartyKeys& keys) noexcept;

        cop::core::Status get_public_keys(std::string_view party_id, PartyKeys* out) const noexcept override;

        [[nodiscard]] std::size_t size() const noexcept { return parties_.size(); }

    private:
        std::map<std::string, PartyKeys, std::less<>> parties_;
    };

} // namespace cop::identity
