#include <verdict/execution/system_program.hpp>
#include <verdict/schema/program_error.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace verdict::schema;

namespace verdict::execution::system_program {

void create_slot(const create_slot_request_t& request,
                 const create_slot_authority_t& authority,
                 slot_t& funder,
                 slot_t& target) {
  if (!authority.funder_signed) {
    throw program_error{error_code::unauthorized, "funder did not sign"};
  }

  auto target_authorized =
      authority.target_signed ||
      std::ranges::any_of(authority.proofs, [&](const auto& proof) {
        return verdict::address::verify(proof, authority.invoker,
                                        request.target);
      });
  if (!target_authorized) {
    throw program_error{error_code::unauthorized,
                        fmt::format("no authority for target {}",
                                    to_base58(request.target))};
  }

  if (!is_vacant(target)) {
    throw program_error{error_code::slot_already_exists,
                        fmt::format("slot {} already in use",
                                    to_base58(request.target))};
  }

  if (request.space > kMaxSlotDataSize) {
    throw program_error{error_code::invalid_slot_size,
                        fmt::format("requested {} bytes, limit is {}",
                                    request.space, kMaxSlotDataSize)};
  }

  if (funder.lamports < request.lamports) {
    throw program_error{error_code::insufficient_funds,
                        fmt::format("balance {} below required {}",
                                    funder.lamports, request.lamports)};
  }

  funder.lamports -= request.lamports;
  target.lamports = request.lamports;
  target.data.assign(request.space, 0);
  target.owner = request.owner;
  spdlog::debug("Created slot {} ({} bytes, {} lamports) owned by {}",
                to_base58(request.target), request.space, request.lamports,
                to_base58(request.owner));
}

}  // namespace verdict::execution::system_program
