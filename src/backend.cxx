/** Implementation of the pgtx::backend interface's shared parts.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include "pgtx/backend.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/sqlstate.hxx"


std::string pgtx::server_error::text() const
{
  auto const name{pgtx::sqlstate::name_for(this->sqlstate)};
  if (std::empty(name))
    return internal::concat(severity, " ", this->sqlstate, ": ", message);
  return internal::concat(
    severity, " ", this->sqlstate, " (", name, "): ", message);
}


pgtx::backend::~backend() = default;


void pgtx::backend::process_notice(std::string_view msg) const noexcept
{
  if (m_notice_handler and not std::empty(msg))
    m_notice_handler(msg);
}
