/** Implementation of types-related helpers.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include "pgtx/types.hxx"


std::string_view pgtx::to_string(transaction_status status) noexcept
{
  switch (status)
  {
  case transaction_status::idle: return "idle";
  case transaction_status::in_transaction: return "in_transaction";
  case transaction_status::failed: return "failed";
  }
  PGTX_UNREACHABLE;
}


std::string_view pgtx::to_string(strategy s) noexcept
{
  switch (s)
  {
  case strategy::strict: return "strict";
  case strategy::naive: return "naive";
  }
  PGTX_UNREACHABLE;
}


std::string_view pgtx::to_string(command_kind kind) noexcept
{
  switch (kind)
  {
  case command_kind::begin: return "begin";
  case command_kind::commit: return "commit";
  case command_kind::rollback: return "rollback";
  case command_kind::savepoint: return "savepoint";
  case command_kind::release: return "release";
  case command_kind::rollback_to: return "rollback_to";
  case command_kind::statement: return "statement";
  }
  PGTX_UNREACHABLE;
}
