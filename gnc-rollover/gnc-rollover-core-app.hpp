/*
 * gnc-rollover-core-app.hpp -- Basic application object for the rollover tool
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

#ifndef GNC_ROLLOVER_CORE_APP_HPP
#define GNC_ROLLOVER_CORE_APP_HPP

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <memory>
#include <string>
#include <vector>

namespace GncRollover {

namespace bpo = boost::program_options;

class CoreApp
{
public:
    CoreApp (const char* app_name);

    /** Parse the command line. Exits for --help, --version and bad options. */
    void parse_command_line (int argc, char **argv);
    /** Set up the environment, logging and the engine. */
    void start (void);
    void shutdown (void);

protected:
    std::string m_app_name;
    std::string m_tagline;
    boost::optional <std::string> m_log_to_filename;

    bpo::options_description m_opt_desc_all;
    std::unique_ptr<bpo::options_description> m_opt_desc_display;
    bpo::variables_map m_opt_map;
    bpo::positional_options_description m_pos_opt_desc;

private:
    void add_common_program_options (void);

    /* Command-line option variables */
    bool m_show_help = false;
    bool m_show_version = false;
    bool m_debug = false;
    std::vector <std::string> m_log_flags;

    char *sys_locale = nullptr;
};

}
#endif
