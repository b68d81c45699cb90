#pragma once

#include <refuge/schema/primitives.hpp>

namespace refuge::crypto {

bool available();

bool verify_signature(const refuge::schema::bytes_view_t& message,
                      const refuge::schema::signer_id_t& signer,
                      const refuge::schema::signature_t& signature);

}  // namespace refuge::crypto
