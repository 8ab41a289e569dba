#pragma once

#include <trustee/schema/primitives.hpp>
#include <functional>

namespace trustee::execution {

/// Host callback that moves value out of custody. Returning false (or
/// throwing) fails the executing proposal and rolls the call back.
using transfer_handler_t =
    std::function<bool(const trustee::schema::participant_id_t& destination,
                       const trustee::schema::amount_t& amount)>;

}  // namespace trustee::execution
