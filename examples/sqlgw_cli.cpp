// Copyright (c) 2024 liudegui. MIT License.
//
// sqlgw command-line front end -- runs one request against one database.
//
// Usage:
//   ./sqlgw_cli [-c config.json] [-n name] [-u user -p password] [-v]
//               <database-path> <request.json | ->
//
// Prints the response JSON on stdout. Exit status is 0 when the response
// status is 200, 1 otherwise, 2 on usage errors.

#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "sqlgw/connection_registry.hpp"
#include "sqlgw/db_config.hpp"
#include "sqlgw/gateway.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::fprintf(stderr,
               "Usage: %s [-c config.json] [-n name] [-u user -p password] "
               "[-v] <database-path> <request.json | ->\n",
               argv0);
}

bool ReadStdin(std::string* out) {
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), stdin)) > 0) {
    out->append(buf, n);
  }
  return std::ferror(stdin) == 0;
}

}  // namespace

int main(int argc, char** argv) {
  const char* config_path = nullptr;
  const char* user = nullptr;
  const char* password = nullptr;
  std::string name = "main";
  const char* positional[2] = {nullptr, nullptr};
  int32_t num_positional = 0;

  for (int32_t i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;
    if (std::strcmp(arg, "-c") == 0 && has_value) {
      config_path = argv[++i];
    } else if (std::strcmp(arg, "-n") == 0 && has_value) {
      name = argv[++i];
    } else if (std::strcmp(arg, "-u") == 0 && has_value) {
      user = argv[++i];
    } else if (std::strcmp(arg, "-p") == 0 && has_value) {
      password = argv[++i];
    } else if (std::strcmp(arg, "-v") == 0) {
      spdlog::set_level(spdlog::level::debug);
    } else if (std::strcmp(arg, "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    } else if (num_positional < 2 &&
               (arg[0] != '-' || std::strcmp(arg, "-") == 0)) {
      positional[num_positional++] = arg;
    } else {
      PrintUsage(argv[0]);
      return 2;
    }
  }
  if (num_positional != 2 || ((user == nullptr) != (password == nullptr))) {
    PrintUsage(argv[0]);
    return 2;
  }

  sqlgw::DbConfig config;
  if (config_path != nullptr) {
    sqlgw::Error err = sqlgw::LoadDbConfig(config_path, &config);
    if (!err.ok()) {
      std::fprintf(stderr, "Config error: %s\n", err.message);
      return 2;
    }
  }

  sqlgw::ConnectionRegistry registry;
  sqlgw::Error err = registry.Add(name, positional[0], std::move(config));
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }

  std::string body;
  if (std::strcmp(positional[1], "-") == 0) {
    if (!ReadStdin(&body)) {
      std::fprintf(stderr, "Cannot read request from stdin\n");
      return 1;
    }
  } else {
    err = sqlgw::ReadTextFile(positional[1], &body);
    if (!err.ok()) {
      std::fprintf(stderr, "%s\n", err.message);
      return 1;
    }
  }

  sqlgw::Credentials creds;
  const sqlgw::Credentials* transport_creds = nullptr;
  if (user != nullptr) {
    creds.user = user;
    creds.password = password;
    transport_creds = &creds;
  }

  sqlgw::Response resp =
      sqlgw::HandleRequest(registry, name, body, transport_creds);
  std::printf("%s\n", resp.Dump(2).c_str());
  return resp.status == sqlgw::kStatusOk ? 0 : 1;
}
