
#include "directory_client.hpp"
#include "highway_session.hpp"
#include "logging.hpp"
#include "util.hpp"
#include "web_fetch.hpp"
#include <asio.hpp>
#include <fstream>
#include <iostream>

using namespace highway;

static void usage() {
  std::cerr
      << "usage: highway_client <command> [options]\n"
         "  servers --uin N --subid N --imei S [--url U] [--insecure]\n"
         "  upload  --server HOST:PORT --file PATH --cmd N --uin N --subid N\n"
         "          --key HEX [--seq N]\n"
         "  fetch   --url U [--out PATH] [--max N] [--timeout N] [--mime S]\n"
         "          [--proxy]\n"
         "global: --log-level trace|debug|info|warn|error\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string command = argv[1];

  ClientIdentity id;
  DirectoryConfig dir_cfg;
  FetchOptions fetch_opts;
  std::string server, file, key_hex, url, out_path;
  uint32_t cmd = 0;
  int seq = -1;

  try {
    for (int i = 2; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--uin")
        id.uin = std::stoull(next(i));
      else if (a == "--subid")
        id.sub_id = (uint32_t)std::stoul(next(i));
      else if (a == "--imei")
        id.imei = next(i);
      else if (a == "--url")
        url = next(i);
      else if (a == "--insecure")
        dir_cfg.verify_peer = false;
      else if (a == "--server")
        server = next(i);
      else if (a == "--file")
        file = next(i);
      else if (a == "--cmd")
        cmd = (uint32_t)std::stoul(next(i));
      else if (a == "--key")
        key_hex = next(i);
      else if (a == "--seq")
        seq = std::stoi(next(i));
      else if (a == "--out")
        out_path = next(i);
      else if (a == "--max")
        fetch_opts.max_bytes = (size_t)std::stoull(next(i));
      else if (a == "--timeout")
        fetch_opts.timeout_seconds = std::stoi(next(i));
      else if (a == "--mime")
        fetch_opts.mime_prefix = next(i);
      else if (a == "--proxy")
        fetch_opts.use_proxy = true;
      else if (a == "--log-level") {
        LogLevel lvl;
        if (!parse_log_level(next(i), lvl)) {
          std::cerr << "bad log level" << std::endl;
          return 1;
        }
        Logger::instance().set_level(lvl);
      } else {
        std::cerr << "unknown option " << a << "\n";
        usage();
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "bad option value: " << e.what() << std::endl;
    return 1;
  }

  asio::io_context io;
  int rc = 1;

  if (command == "servers") {
    if (!url.empty())
      dir_cfg.url = url;
    get_server_list(io, id, dir_cfg, [&rc](DirectoryResult &&r) {
      if (r.ec) {
        std::cerr << r.ec.message() << ": " << r.detail << std::endl;
        return;
      }
      for (auto &s : r.servers)
        std::cout << s.address << ":" << s.port << "\n";
      rc = 0;
    });
  } else if (command == "upload") {
    std::string host;
    uint16_t port;
    if (!parse_host_port(server, host, port)) {
      std::cerr << "bad server" << std::endl;
      return 1;
    }
    std::vector<uint8_t> key = hex_to_bytes(key_hex);
    if (!key_hex.empty() && key.empty()) {
      std::cerr << "bad key" << std::endl;
      return 1;
    }
    UploadObject obj;
    try {
      obj = make_upload_object(read_file(file), std::move(key));
    } catch (const std::exception &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
    auto report = [&rc](const HighwayResult &r) {
      std::cout << to_string(r.outcome) << ": " << r.frames_acked << "/"
                << r.frames_total << " frames acknowledged" << std::endl;
      if (r.ok())
        rc = 0;
    };
    if (seq > 65535) {
      std::cerr << "bad seq" << std::endl;
      return 1;
    }
    std::optional<uint16_t> first_seq;
    if (seq >= 0)
      first_seq = (uint16_t)seq;
    highway_upload(io, id, host, port, obj, cmd, report, first_seq);
  } else if (command == "fetch") {
    download_from_web(io, url, fetch_opts, [&rc, &out_path](FetchResult &&r) {
      if (!r.ok) {
        std::cerr << r.error << std::endl;
        return;
      }
      if (out_path.empty()) {
        std::cout.write((const char *)r.body.data(),
                        (std::streamsize)r.body.size());
      } else {
        std::ofstream out(out_path, std::ios::binary);
        out.write((const char *)r.body.data(), (std::streamsize)r.body.size());
        if (!out) {
          std::cerr << "cannot write " << out_path << std::endl;
          return;
        }
      }
      rc = 0;
    });
  } else {
    usage();
    return 1;
  }

  io.run();
  return rc;
}
