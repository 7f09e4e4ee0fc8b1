#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "cop/cli/app.hpp"
#include "cop/cli/commands.hpp"
#include "cop/cli/options.hpp"
#include "cop/core/buffer.hpp"
#include "cop/core/encoding.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"
#include "cop/document/canonical.hpp"
#include "cop/document/hashing.hpp"
#include "cop/document/value.hpp"
#include "cop/identity/registry.hpp"
#include "cop/identity/vault.hpp"
#include "cop/protocol/keywrap.hpp"
#include "cop/protocol/layered.hpp"
#include "cop/protocol/records.hpp"
#include "cop/protocol/share.hpp"
#include "cop/protocol/transaction.hpp"
#include "cop/protocol/transcript.hpp"
#include "cop/security/asymmetric.hpp"
#include "cop/security/crypto.hpp"
#include "cop/security/kdf.hpp"
#include "cop/store/file_io.hpp"
#include "cop/store/file_key_vault.hpp"
#include "cop/store/record_store.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
