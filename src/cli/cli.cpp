#include "cli/cli.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include "record/record_key.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace sevault {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(session::Session& session, std::istream& in, std::ostream& out)
  : running_(false)
  , session_(session)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting command loop";
  out_ << "sevault> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = process_line(line);
    if (running_) {
      out_ << "sevault> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Command loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::process_line(const std::string& line) {
  std::istringstream iss(line);
  std::string command, username, address;

  iss >> command;
  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }
  if (command == "help") {
    handle_help_command();
    return true;
  }

  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command;

  if (!(iss >> username >> address)) {
    out_ << "Invalid input. Usage: <command> <username> <address> [argument]" << std::endl;
    return true;
  }

  std::string argument;
  std::getline(iss >> std::ws, argument);

  if (command == "store" && !argument.empty()) {
    handle_store_command(username, address, argument);
  }
  else if (command == "read") {
    handle_read_command(username, address, argument);
  }
  else if (command == "fstore" && !argument.empty()) {
    handle_fixed_store_command(username, address, argument);
  }
  else if (command == "fread" && argument.empty()) {
    handle_fixed_read_command(username, address);
  }
  else if (command == "fdelete" && argument.empty()) {
    handle_fixed_delete_command(username, address);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}

void CLI::handle_store_command(const std::string& username, const std::string& address, const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  std::vector<uint8_t> payload((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  try {
    session::OperationResult result = session_.store(record::RecordKey::from_strings(username, address), payload);
    if (!result) {
      display_failure("Store", result);
      return;
    }
    out_ << "Stored " << payload.size() << " bytes" << std::endl;
  } catch (const protocol::ProtocolError& e) {
    log_and_display_error("Invalid record key", e.what());
  }
}

void CLI::handle_read_command(const std::string& username, const std::string& address, const std::string& out_file) {
  session::OperationResult result = session::OperationResult::ok();
  try {
    result = session_.read(record::RecordKey::from_strings(username, address));
  } catch (const protocol::ProtocolError& e) {
    log_and_display_error("Invalid record key", e.what());
    return;
  }

  if (!result) {
    display_failure("Read", result);
    return;
  }

  const std::vector<uint8_t>& payload = *result.payload();
  if (out_file.empty()) {
    out_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    out_ << std::endl;
    return;
  }

  std::ofstream file(out_file, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << out_file << std::endl;
    return;
  }
  file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  out_ << "Wrote " << payload.size() << " bytes to " << out_file << std::endl;
}

void CLI::handle_fixed_store_command(const std::string& username, const std::string& address, const std::string& message) {
  session::OperationResult result =
    session_.store_fixed(username, address, std::vector<uint8_t>(message.begin(), message.end()));
  if (!result) {
    display_failure("Fixed store", result);
    return;
  }
  const std::vector<uint8_t>& receipt = *result.payload();
  out_ << "Stored at index " << static_cast<int>(receipt[0])
       << " (" << static_cast<int>(receipt[1]) << " records)" << std::endl;
}

void CLI::handle_fixed_read_command(const std::string& username, const std::string& address) {
  session::OperationResult result = session_.read_fixed(username, address);
  if (!result) {
    display_failure("Fixed read", result);
    return;
  }
  const std::vector<uint8_t>& message = *result.payload();
  out_ << std::string(message.begin(), message.end()) << std::endl;
}

void CLI::handle_fixed_delete_command(const std::string& username, const std::string& address) {
  session::OperationResult result = session_.remove_fixed(username, address);
  if (!result) {
    display_failure("Fixed delete", result);
    return;
  }
  const std::vector<uint8_t>& receipt = *result.payload();
  out_ << "Deleted index " << static_cast<int>(receipt[0])
       << " (" << static_cast<int>(receipt[1]) << " records remain)" << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                                Display this help message" << std::endl;
  out_ << "  store <user> <addr> <file>          Store <file> as a variable-length record" << std::endl;
  out_ << "  read <user> <addr> [file]           Read a record, optionally into <file>" << std::endl;
  out_ << "  fstore <user> <addr> <message>      Store a fixed-length record" << std::endl;
  out_ << "  fread <user> <addr>                 Read a fixed-length record" << std::endl;
  out_ << "  fdelete <user> <addr>               Delete a fixed-length record" << std::endl;
  out_ << "  quit                                Exit the shell" << std::endl << std::endl;
}

void CLI::display_failure(const std::string& action, const session::OperationResult& result) {
  std::ostringstream detail;
  detail << *result.error_kind();
  if (result.status_code()) {
    detail << " (SW " << protocol::format_status(*result.status_code()) << ")";
  }
  detail << " " << result.message();
  log_and_display_error(action + " failed", detail.str());
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace sevault
