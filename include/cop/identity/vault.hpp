#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "cop/core/errors.hpp"
#include "cop/identity/registry.hpp"
#include "cop/security/asymmetric.hpp"

namespace cop::identity {

    // Both key pairs of one party. Only vaults and key generation hold this.
    struct PartySecrets {
        std::string id;
        cop::security::SigningKeyPair signing{};
        cop::security::EncKeyPair encryption{};
    };

    cop::core::Status generate_party(std::string_view id, PartySecrets* out) noexcept;

    [[nodiscard]] PartyKeys public_keys_of(const PartySecrets& secrets);

    // Wipes both private keys; the id is kept.
    void scrub(PartySecrets* secrets) noexcept;

    // Source of private key material for one call at a time.
    class KeyVault {
    public:
        virtual ~KeyVault() = default;

        virtual cop::core::Status get_signing_key(std::string_view party_id,
            cop::security::SigningPrivateKey* out) const noexcept = 0;

        virtual cop::core::Status get_encryption_key(std::string_view party_id,
            cop::security::EncPrivateKey* out) const noexcept = 0;
    };

    class MemoryVault final : public KeyVault {
    public:
        MemoryVault() = default;
        MemoryVault(const MemoryVault&) = delete;
        MemoryVault& operator=(const MemoryVault&) = delete;
        ~MemoryVault() override;

        cop::core::Status put(const PartySecrets& secrets) noexcept;

        cop::core::Status get_signing_key(std::string_view party_id,
            cop::security::SigningPrivateKey* out) const noexcept override;

        cop::core::Status get_encryption_key(std::string_view party_id,
            cop::security::EncPrivateKey* out) const noexcept override;

    private:
        std::map<std::string, PartySecrets, std::less<>> parties_;
    };

} // namespace cop::identity
