#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cop/core/errors.hpp"
#include "cop/identity/vault.hpp"

namespace cop::store {

    // One <id>.json per party in dir:
    //   {"id", "signing": {"private", "public"}, "encryption": {"private", "public"}}
    // Raw keys in unpadded base64url. Files are 0600, the directory 0700.
    class FileKeyVault final : public cop::identity::KeyVault {
    public:
        explicit FileKeyVault(std::string dir);

        [[nodiscard]] const std::string& dir() const noexcept { return dir_; }
        [[nodiscard]] std::string path_for(std::string_view party_id) const;

        // Conflict when a key file exists and overwrite is false.
        cop::core::Status save(const cop::identity::PartySecrets& secrets, bool overwrite) noexcept;

        // Structural when the file is malformed or its public halves do not
        // match the private keys.
        cop::core::Status load(std::string_view party_id, cop::identity::PartySecrets* out) const noexcept;

        cop::core::Status list_parties(std::vector<std::string>* out) const noexcept;

        cop::core::Status get_signing_key(std::string_view party_id,
            cop::security::SigningPrivateKey* out) const noexcept override;

        cop::core::Status get_encryption_key(std::string_view party_id,
            cop::security::EncPrivateKey* out) const noexcept override;

    private:
        std::string dir_;
    };

} // namespace cop::store
