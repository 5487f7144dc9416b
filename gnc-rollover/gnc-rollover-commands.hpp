/*
 * gnc-rollover-commands.hpp -- Commands run by the rollover tool
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

#ifndef GNC_ROLLOVER_COMMANDS_HPP
#define GNC_ROLLOVER_COMMANDS_HPP

#include <string>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <gnc-rollover.hpp>

using bo_str = boost::optional <std::string>;

namespace GncRollover {

    namespace bpo = boost::program_options;

    /** Command line values of a rollover. */
    struct RolloverArgs
    {
        bo_str previous_file;
        bo_str new_file;
        std::string equity_name;
        std::string opening_name;
        std::string description;
        std::string opening_date;
        std::string currency;
        std::string separator;

        /* Underscore spellings of the options above, accepted but not
         * shown in the help. They win over the dashed ones. */
        bo_str legacy_equity_name;
        bo_str legacy_opening_name;
        bo_str legacy_description;
        bo_str legacy_opening_date;
    };

    /** Register the rollover options writing into @a args. The visible
     * options are added to both @a display and @a all, the file names and
     * underscore spellings to @a all only. */
    void add_rollover_options (RolloverArgs& args,
                               bpo::options_description& display,
                               bpo::options_description& all,
                               bpo::positional_options_description& positional);

    /** Check @a args and turn them into rollover parameters.
     * @exception LedgerError, logged with PERR, if a file name is missing,
     * the separator is empty or the opening date can't be parsed. */
    RolloverParams make_rollover_params (const RolloverArgs& args);

    /** Run a rollover on the engine's file backends.
     * @return the process exit status. */
    int run_rollover (const RolloverParams& params);
}
#endif
