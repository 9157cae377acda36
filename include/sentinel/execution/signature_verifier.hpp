#pragma once

#include <sentinel/schema/primitives.hpp>
#include <functional>

namespace sentinel::execution {

using signature_verifier_t =
    std::function<bool(const sentinel::schema::bytes_view_t& message,
                       const sentinel::schema::signer_id_t& signer,
                       const sentinel::schema::signature_t& signature)>;

}  // namespace sentinel::execution
