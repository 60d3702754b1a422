#ifndef SEVAULT_CLI_HPP
#define SEVAULT_CLI_HPP

#include <iostream>
#include <string>
#include "session/session.hpp"

namespace sevault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(session::Session& session, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Handles one input line, returns false once the user asked to quit
    bool process_line(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    session::Session& session_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void handle_store_command(const std::string& username, const std::string& address, const std::string& filename);
    void handle_read_command(const std::string& username, const std::string& address, const std::string& out_file);
    void handle_fixed_store_command(const std::string& username, const std::string& address, const std::string& message);
    void handle_fixed_read_command(const std::string& username, const std::string& address);
    void handle_fixed_delete_command(const std::string& username, const std::string& address);
    void handle_help_command();
    void display_failure(const std::string& action, const session::OperationResult& result);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace sevault

#endif // SEVAULT_CLI_HPP
