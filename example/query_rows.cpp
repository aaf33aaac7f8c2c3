//
// Copyright (c) 2019-2024 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mysqlstream/connect_params.hpp>
#include <mysqlstream/connection.hpp>
#include <mysqlstream/cursor.hpp>
#include <mysqlstream/error_with_diagnostics.hpp>
#include <mysqlstream/throw_on_error.hpp>

#include <boost/asio/io_context.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

/**
 * Reads the rows of a query one at a time, using a cursor.
 *
 * Cursors don't hold the whole resultset in memory. Each call to advance()
 * reads a single row from the server. Columns are then read in order,
 * converting each column's text into the requested type.
 *
 * Accessors don't throw. Errors are latched by the cursor, and should be
 * checked once the read loop finishes.
 */
void main_impl(int argc, char** argv)
{
    if (argc != 4)
    {
        std::cerr << "Usage: " << argv[0] << " <username> <password> <server-hostname>\n";
        exit(1);
    }

    // The library logs to a logger named "mysqlstream". Registering it before
    // creating any connection lets us choose the sink and the level
    auto logger = spdlog::stderr_color_mt("mysqlstream");
    logger->set_level(spdlog::level::debug);

    // Where and how to connect to the server
    mysqlstream::connect_params params;
    params.server_host = argv[3];
    params.username = argv[1];
    params.password = argv[2];
    params.database = "mysqlstream_examples";

    boost::asio::io_context ctx;
    mysqlstream::connection conn(ctx);

    // Resolves the hostname, connects the socket and authenticates
    conn.connect(params);

    // query returns a cursor. Rows are read as we advance
    mysqlstream::cursor cur = conn.query(
        "SELECT first_name, last_name, salary, is_active FROM employee WHERE company_id = 'HGS'"
    );
    std::cout << "The resultset has " << cur.columns().size() << " columns\n";

    while (cur.advance())
    {
        std::string first_name = cur.read_string();
        std::string last_name = cur.read_string();
        auto salary = cur.read_nullable_double();  // salary may be NULL
        bool is_active = cur.read_bool();

        std::cout << "Employee '" << first_name << " " << last_name << "' ";
        if (salary.is_null)
            std::cout << "has no salary";
        else
            std::cout << "earns " << salary.value << " dollars yearly";
        std::cout << (is_active ? "\n" : " (inactive)\n");
    }

    // advance returns false at the end of the resultset, but also on error.
    // This throws if either a row couldn't be read or a value couldn't be converted
    mysqlstream::throw_on_error(cur.last_error(), cur.last_diagnostics());

    // Statements that don't return rows can use execute.
    // The connection is free again, since we read the cursor until its end
    auto res = conn.execute("UPDATE employee SET salary = 10000 WHERE first_name = 'Underpaid'");
    std::cout << "Updated " << res.affected_rows << " rows\n";

    // Notifies the server we want to log out, then closes the socket
    conn.close();
}

int main(int argc, char** argv)
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const mysqlstream::error_with_diagnostics& err)
    {
        // Some errors include additional diagnostics, like server-provided error messages.
        // Security note: diagnostics::server_message may contain user-supplied values (e.g. the
        // field value that caused the error) and is encoded using the connection's character set
        // (UTF-8 by default). Treat it as untrusted input.
        std::cerr << "Error: " << err.what() << '\n'
                  << "Server diagnostics: " << err.get_diagnostics().server_message() << std::endl;
        return 1;
    }
    catch (const std::exception& err)
    {
        std::cerr << "Error: " << err.what() << std::endl;
        return 1;
    }
}
