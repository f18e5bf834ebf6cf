#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <arrow/buffer.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using localdisk::persistence::Message;

static void Usage() {
  std::cout << "Usage:\n"
            << "  localdiskctl --config <config.yaml> blob put <blob> <file|-> [--overwrite] [--lease <lease_id>]\n"
            << "  localdiskctl --config <config.yaml> blob lease-put <blob> <seconds> <file|->\n"
            << "  localdiskctl --config <config.yaml> blob get <blob>\n"
            << "  localdiskctl --config <config.yaml> blob purge\n"
            << "  localdiskctl --config <config.yaml> queue send <text>\n"
            << "  localdiskctl --config <config.yaml> queue receive [max=1] [visibility_seconds=30]\n"
            << "  localdiskctl --config <config.yaml> queue ack <message_id> <delete_token>\n"
            << "  localdiskctl --config <config.yaml> queue purge\n";
}

/*
  Typed store errors become distinct exit codes so scripts can branch
  on them; anything else is a generic failure.
*/
static int ExitCode(const std::exception& e) {
  using namespace localdisk::util;

  if (dynamic_cast<const NotFound*>(&e)) return 3;
  if (dynamic_cast<const AlreadyExists*>(&e)) return 4;
  if (dynamic_cast<const LeaseConflict*>(&e)) return 5;
  if (dynamic_cast<const LeaseNotFound*>(&e)) return 6;
  if (dynamic_cast<const MessageNotFound*>(&e)) return 7;
  return 2;
}

static std::shared_ptr<arrow::Buffer> ReadInput(const std::string& source) {
  std::string data;
  if (source == "-") {
    data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
      throw std::runtime_error("cannot open input file: " + source);
    }
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  return arrow::Buffer::FromString(std::move(data));
}

static int RunBlob(localdisk::persistence::Blob& blob, int argc, char** argv, int pos) {
  if (pos >= argc) return 1;
  const std::string cmd = argv[pos++];

  // ------------------------------------------------------------

  if (cmd == "put") {
    if (argc - pos < 2) return 1;
    const std::string name   = argv[pos++];
    const std::string source = argv[pos++];

    bool                       overwrite = false;
    std::optional<std::string> lease_id;
    while (pos < argc) {
      const std::string flag = argv[pos++];
      if (flag == "--overwrite") {
        overwrite = true;
      } else if (flag == "--lease" && pos < argc) {
        lease_id = argv[pos++];
      } else {
        std::cerr << "unknown flag: " << flag << "\n";
        return 1;
      }
    }

    blob.UploadBlob(name, ReadInput(source), overwrite, lease_id);
    std::cout << "uploaded\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lease-put") {
    if (argc - pos < 3) return 1;
    const std::string name     = argv[pos++];
    const auto        duration = std::chrono::seconds(std::stoul(argv[pos++]));
    const std::string source   = argv[pos++];

    auto data  = ReadInput(source);
    auto lease = blob.LeaseBlob(name, duration);
    blob.UploadBlob(name, data, /*overwrite=*/true, lease->LeaseId());
    lease->Release();

    std::cout << "lease=" << lease->LeaseId() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc - pos < 1) return 1;
    std::cout << blob.DownloadBlob(argv[pos]);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purge") {
    blob.DeleteContainer();
    std::cout << "deleted\n";
    return 0;
  }

  return 1;
}

static int RunQueue(localdisk::persistence::Queue& queue, int argc, char** argv, int pos) {
  if (pos >= argc) return 1;
  const std::string cmd = argv[pos++];

  // ------------------------------------------------------------

  if (cmd == "send") {
    if (argc - pos < 1) return 1;
    queue.SendMessage(argv[pos]);
    std::cout << "sent\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "receive") {
    uint32_t max_messages = 1;
    uint32_t visibility   = 30;
    if (pos < argc) max_messages = static_cast<uint32_t>(std::stoul(argv[pos++]));
    if (pos < argc) visibility = static_cast<uint32_t>(std::stoul(argv[pos++]));

    for (const auto& message : queue.ReceiveMessages(max_messages, std::chrono::seconds(visibility))) {
      std::cout << message.message_id << '\t' << message.delete_token << '\t' << message.dequeue_count << '\t' << message.content
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ack") {
    if (argc - pos < 2) return 1;
    Message message;
    message.message_id   = argv[pos++];
    message.delete_token = argv[pos++];
    queue.DeleteMessage(message);
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purge") {
    queue.DeleteQueue();
    std::cout << "deleted\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string service     = argv[3];

  try {
    auto config = localdisk::config::ConfigLoader::LoadFromYaml(config_path);
    localdisk::observability::InitializeLogging(config.logging());

    auto runtime = localdisk::factory::Build(config);

    int rc = 1;
    if (service == "blob" && runtime.blob) {
      rc = RunBlob(*runtime.blob, argc, argv, 4);
    } else if (service == "queue" && runtime.queue) {
      rc = RunQueue(*runtime.queue, argc, argv, 4);
    } else {
      std::cerr << "service not configured: " << service << "\n";
    }

    if (rc == 1) Usage();
    localdisk::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    LOCALDISK_LOG_ERROR("Command failed", {localdisk::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    localdisk::observability::ShutdownLogging();
    return ExitCode(e);
  }
}
