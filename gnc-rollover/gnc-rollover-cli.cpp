/*
 * gnc-rollover-cli.cpp -- Start a new fiscal year book from the command line
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
#include "gnc-rollover-core-app.hpp"

#include <Account.h>
#include <qoflog.h>

#include <boost/locale.hpp>
#include <iostream>

namespace bl = boost::locale;

/* This static indicates the debugging module that this .o belongs to.  */
static QofLogModule log_module = "gnc.rollover";

namespace GncRollover {

    class RolloverCli : public CoreApp
    {
    public:
        RolloverCli (const char* app_name);
        void parse_command_line (int argc, char **argv);
        int start (void);
    private:
        RolloverArgs m_args;
    };

}

GncRollover::RolloverCli::RolloverCli (const char *app_name) : GncRollover::CoreApp (app_name)
{
    add_rollover_options (m_args, *m_opt_desc_display, m_opt_desc_all, m_pos_opt_desc);
}

void
GncRollover::RolloverCli::parse_command_line (int argc, char **argv)
{
    GncRollover::CoreApp::parse_command_line (argc, argv);

    if (!m_log_to_filename || m_log_to_filename->empty())
        m_log_to_filename = "stderr";
}

int
GncRollover::RolloverCli::start (void)
{
    GncRollover::CoreApp::start();

    RolloverParams params;
    try
    {
        params = make_rollover_params (m_args);
    }
    catch (const LedgerError& err)
    {
        std::cerr << err.what() << "\n\n" << *m_opt_desc_display.get();
        shutdown();
        return 1;
    }

    gnc_set_account_separator (m_args.separator.c_str());
    PINFO ("Rolling over %s into %s", params.previous_file.c_str(), params.new_file.c_str());

    auto result = run_rollover (params);
    shutdown();
    return result;
}

int
main(int argc, char **argv)
{
    GncRollover::RolloverCli application (argv[0]);
    application.parse_command_line (argc, argv);
    return application.start ();
}
