/*
 * gnc-rollover-commands.cpp -- Commands run by the rollover tool
 *
 * Copyright (C) 2025 gnucash-rollover contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of
 * the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, contact:
 *
 * Free Software Foundation           Voice:  +1-617-542-5942
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652
 * Boston, MA  02110-1301,  USA       gnu@gnu.org
 */
#include <config.h>

#include "gnc-rollover-commands.hpp"

#include <qof.h>
#include <qoflog.h>
#include <gnc-ledger-engine.hpp>

#include <boost/locale.hpp>
#include <iostream>

namespace bl = boost::locale;

/* This static indicates the debugging module that this .o belongs to.  */
static QofLogModule log_module = "gnc.rollover";

void
GncRollover::add_rollover_options (RolloverArgs& args,
                                   bpo::options_description& display,
                                   bpo::options_description& all,
                                   bpo::positional_options_description& positional)
{
    bpo::options_description rollover_options(bl::translate ("Rollover Options").str());
    rollover_options.add_options()
    ("equity-name", bpo::value (&args.equity_name)->default_value ("Equity"),
     bl::translate ("Name of the top level equity placeholder account").str().c_str())
    ("equity-opening-name", bpo::value (&args.opening_name)->default_value ("Opening balance"),
     bl::translate ("Name of the opening balance account below the equity account").str().c_str())
    ("opening-transaction-text", bpo::value (&args.description)->default_value ("Opening balance"),
     bl::translate ("Description of the opening transactions").str().c_str())
    ("opening-date", bpo::value (&args.opening_date)->default_value ("2025-01-01"),
     bl::translate ("Date of the opening transactions, as YYYY-MM-DD").str().c_str())
    ("currency", bpo::value (&args.currency)->default_value ("USD"),
     bl::translate ("ISO 4217 currency of a newly created opening balance account").str().c_str())
    ("account-separator", bpo::value (&args.separator)->default_value (":"),
     bl::translate ("Separator between the parts of an account's full name").str().c_str());
    display.add (rollover_options);
    all.add (rollover_options);

    bpo::options_description hidden_options(bl::translate ("Hidden Options").str());
    hidden_options.add_options()
    ("previous-file", bpo::value (&args.previous_file),
     bl::translate ("[previous-file]").str().c_str())
    ("new-file", bpo::value (&args.new_file),
     bl::translate ("[new-file]").str().c_str())
    ("equity_name", bpo::value (&args.legacy_equity_name),
     bl::translate ("Same as --equity-name").str().c_str())
    ("equity_opening_name", bpo::value (&args.legacy_opening_name),
     bl::translate ("Same as --equity-opening-name").str().c_str())
    ("opening_transaction_text", bpo::value (&args.legacy_description),
     bl::translate ("Same as --opening-transaction-text").str().c_str())
    ("opening_date", bpo::value (&args.legacy_opening_date),
     bl::translate ("Same as --opening-date").str().c_str());
    all.add (hidden_options);

    positional.add ("previous-file", 1).add ("new-file", 1);
}

static void
report_bad_arguments (const std::string& message)
{
    PERR ("Bad arguments: %s", message.c_str());
    throw GncRollover::LedgerError (message);
}

GncRollover::RolloverParams
GncRollover::make_rollover_params (const RolloverArgs& args)
{
    if (!args.previous_file || args.previous_file->empty() ||
        !args.new_file || args.new_file->empty())
        report_bad_arguments (bl::translate ("Missing previous or new data file parameter"));

    if (args.separator.empty())
        report_bad_arguments (bl::translate ("The account separator must not be empty"));

    RolloverParams params;
    params.previous_file = *args.previous_file;
    params.new_file = *args.new_file;
    params.equity_name = args.legacy_equity_name.value_or (args.equity_name);
    params.opening_name = args.legacy_opening_name.value_or (args.opening_name);
    params.description = args.legacy_description.value_or (args.description);
    params.currency = args.currency;
    try
    {
        params.opening_date = parse_opening_date (args.legacy_opening_date.value_or (args.opening_date));
    }
    catch (const LedgerError& err)
    {
        report_bad_arguments (err.what());
    }
    return params;
}

int
GncRollover::run_rollover (const RolloverParams& params)
{
    GncEngineBackend backend;
    Rollover rollover{backend, params};

    qof_event_suspend();
    try
    {
        rollover.run();
    }
    catch (const LedgerError& err)
    {
        qof_event_resume();
        PERR ("Rollover from %s to %s failed: %s", params.previous_file.c_str(),
              params.new_file.c_str(), err.what());
        std::cerr << bl::translate ("Rollover failed: ") << err.what() << std::endl;
        return 1;
    }
    catch (const std::exception& err)
    {
        qof_event_resume();
        PERR ("Rollover from %s to %s aborted: %s", params.previous_file.c_str(),
              params.new_file.c_str(), err.what());
        std::cerr << bl::translate ("Rollover aborted: ") << err.what() << std::endl;
        return 1;
    }
    qof_event_resume();

    const auto& summary = rollover.summary();
    std::cout << bl::format (bl::translate ("{1}: deleted {2} transactions, "
                                            "created {3} accounts and {4} opening transactions "
                                            "from {5} balances ({6} zero)."))
        % params.new_file % summary.deleted % summary.created_accounts
        % summary.created_transactions % summary.balances % summary.skipped_zero
              << std::endl;
    return 0;
}
