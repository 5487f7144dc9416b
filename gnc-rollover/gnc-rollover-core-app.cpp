/*
 * gnc-rollover-core-app.cpp -- Basic application object for the rollover tool
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

#include "gnc-rollover-core-app.hpp"

#include <glib.h>
#include <gnc-engine.h>
#include <gnc-environment.h>
#include <gnc-filepath-utils.h>
#include <qoflog.h>

#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

#include <libintl.h>

namespace bl = boost::locale;

/* This static indicates the debugging module that this .o belongs to.  */
static QofLogModule log_module = "gnc.rollover";

static std::locale
init_boost_locale (const std::string& messages_path)
{
    try
    {
        bl::generator gen;
        gen.add_messages_path (messages_path);
        gen.add_messages_domain (GETTEXT_PACKAGE);
        return gen ("");
    }
    catch (const std::runtime_error& err)
    {
        g_warning ("Failed to create C++ default locale because %s. "
                   "Using the 'C' locale for C++.", err.what());
        return std::locale::classic();
    }
}

static void
gnc_log_init (const std::vector <std::string> log_flags,
              const boost::optional <std::string> &log_to_filename,
              bool debug)
{
    if (log_to_filename && !log_to_filename->empty())
    {
        qof_log_init_filename_special (log_to_filename->c_str());
    }
    else
    {
        auto tracefilename = g_build_filename (g_get_tmp_dir(), PROJECT_NAME ".trace",
                                               (gchar *)NULL);
        qof_log_init_filename (tracefilename);
        g_free (tracefilename);
    }

    /* Every step of a rollover is worth a line in the log. */
    qof_log_set_level (log_module, QOF_LOG_INFO);

    if (debug)
    {
        qof_log_set_level ("", QOF_LOG_INFO);
        qof_log_set_level ("qof", QOF_LOG_INFO);
        qof_log_set_level ("gnc", QOF_LOG_INFO);
    }

    auto log_config_filename = g_build_filename (gnc_userconfig_dir (),
                                                 "log.conf", (char *)NULL);
    if (g_file_test (log_config_filename, G_FILE_TEST_EXISTS))
        qof_log_parse_log_config (log_config_filename);
    g_free (log_config_filename);

    for (auto log_flag : log_flags)
    {
        if (log_flag.empty () ||
            log_flag[0] == '=' ||
            log_flag[log_flag.length () - 1] == '=' ||
            log_flag.find ('=') == std::string::npos)
        {
            g_warning ("string [%s] not parseable", log_flag.c_str());
            continue;
        }

        std::vector<std::string> split_flag;
        boost::split (split_flag, log_flag, [](char c){return c == '=';});

        auto level = qof_log_level_from_string (split_flag[1].c_str());
        qof_log_set_level (split_flag[0].c_str(), level);
    }
}

GncRollover::CoreApp::CoreApp (const char* app_name) : m_app_name {app_name}
{
    /* This should be called before gettext is initialized
     * The user may have configured a different language via
     * the environment file.
     */
    gnc_environment_setup();
    sys_locale = g_strdup (setlocale (LC_ALL, ""));
    if (!sys_locale)
    {
        std::cerr << "The locale defined in the environment isn't supported. "
                  << "Falling back to the 'C' (US English) locale\n";
        g_setenv ("LC_ALL", "C", TRUE);
        setlocale (LC_ALL, "C");
    }

    bindtextdomain (GETTEXT_PACKAGE, LOCALEDIR);
    bind_textdomain_codeset (GETTEXT_PACKAGE, "UTF-8");

    auto locale = init_boost_locale (LOCALEDIR);
    std::cerr.imbue (locale);
    std::cout.imbue (locale);

    m_tagline = bl::translate ("- start a new fiscal year GnuCash book with opening balances").str();
    m_opt_desc_display = std::make_unique<bpo::options_description>
        ((bl::format (bl::translate ("{1} [options] <previous-file> <new-file>")) % m_app_name).str()
         + std::string(" ") + m_tagline);
    add_common_program_options();
}

void
GncRollover::CoreApp::parse_command_line (int argc, char **argv)
{
    try
    {
        bpo::store (bpo::command_line_parser (argc, argv).
                    options (m_opt_desc_all).positional(m_pos_opt_desc).run(), m_opt_map);
        bpo::notify (m_opt_map);
    }
    catch (std::exception &e)
    {
        std::cerr << e.what() << "\n\n";
        std::cerr << *m_opt_desc_display.get() << std::endl;

        exit(1);
    }

    if (m_show_version)
    {
        std::cout << bl::format (bl::translate ("{1} {2}")) % PROJECT_NAME % PACKAGE_VERSION << "\n";
        exit(0);
    }

    if (m_show_help)
    {
        std::cout << *m_opt_desc_display.get() << std::endl;
        exit(0);
    }
}

/* Define command line options common to all binaries. */
void
GncRollover::CoreApp::add_common_program_options (void)
{
    bpo::options_description common_options(bl::translate ("Common Options").str());
    common_options.add_options()
        ("help,h", bpo::bool_switch (&m_show_help),
         bl::translate ("Show this help message").str().c_str())
        ("version,v", bpo::bool_switch (&m_show_version),
         bl::translate ("Show version").str().c_str())
        ("debug", bpo::bool_switch (&m_debug),
         bl::translate ("Enable debugging mode: provide deep detail in the logs.\nThis is equivalent to: --log \"=info\" --log \"qof=info\" --log \"gnc=info\"").str().c_str())
        ("log", bpo::value (&m_log_flags),
         bl::translate ("Log level overrides, of the form \"modulename={debug,info,warn,crit,error}\"\nExamples: \"--log qof=debug\" or \"--log gnc.rollover.engine=debug\"\nThis can be invoked multiple times.").str().c_str())
        ("logto", bpo::value (&m_log_to_filename),
         bl::translate ("File to log into; defaults to \"stderr\"; can be a file name or \"stdout\".").str().c_str());

    m_opt_desc_all.add (common_options);
    m_opt_desc_display->add (common_options);
}

void
GncRollover::CoreApp::start (void)
{
    auto userdata_migration_msg = gnc_filepath_init();
    if (userdata_migration_msg)
    {
        g_print("\n\n%s\n", userdata_migration_msg);
        g_free (userdata_migration_msg);
    }

    gnc_log_init (m_log_flags, m_log_to_filename, m_debug);
    gnc_engine_init (0, NULL);

    /* Write some locale details to the log to simplify debugging */
    PINFO ("System locale returned %s", sys_locale ? sys_locale : "(null)");
    PINFO ("Effective locale set to %s.", setlocale (LC_ALL, NULL));
    g_free (sys_locale);
    sys_locale = NULL;
}

void
GncRollover::CoreApp::shutdown (void)
{
    gnc_engine_shutdown ();
    qof_log_shutdown ();
}
