/********************************************************************
 * gnc-ledger.cpp -- Narrow access layer over a GnuCash book        *
 * Copyright (C) 2025 gnucash-rollover contributors                 *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 *******************************************************************/

#include <config.h>
#include <qoflog.h>

#include "gnc-ledger.hpp"

static const QofLogModule log_module = "gnc.rollover";

namespace GncRollover {

TransactionEdit::TransactionEdit(LedgerTransaction& trans) : m_trans{trans}
{
    m_trans.begin_edit();
}

TransactionEdit::~TransactionEdit()
{
    if (m_committed)
        return;
    try
    {
        DEBUG ("rolling back uncommitted transaction edit");
        m_trans.rollback_edit();
    }
    catch (const std::exception& err)
    {
        PERR ("Rollback of transaction edit failed: %s", err.what());
    }
}

void
TransactionEdit::commit()
{
    m_trans.commit_edit();
    m_committed = true;
}

} // namespace GncRollover
