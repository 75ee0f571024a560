#pragma once
#include "config.hpp"
#include "limiter.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace visionsync {

struct InterfaceAddress {
  std::string name;
  std::string address; // dotted IPv4
  bool up = true;
  bool loopback = false;
};

class INetworkInterfaces {
public:
  virtual ~INetworkInterfaces() = default;
  virtual std::vector<InterfaceAddress> list_ipv4() = 0;
};

// getifaddrs(3)
class SystemNetworkInterfaces final : public INetworkInterfaces {
public:
  std::vector<InterfaceAddress> list_ipv4() override;
};

struct ProbeResponse {
  int status = 0;
  std::string body;
};

class IProbeClient {
public:
  virtual ~IProbeClient() = default;
  // nullopt on refusal, timeout or a malformed HTTP response.
  virtual std::optional<ProbeResponse>
  get(const std::string &host, int port, const std::string &path,
      std::chrono::milliseconds timeout) = 0;
};

// HTTP/1.1 GET over a plain TCP socket.
class HttpProbeClient final : public IProbeClient {
public:
  std::optional<ProbeResponse> get(const std::string &host, int port,
                                   const std::string &path,
                                   std::chrono::milliseconds timeout) override;
};

// Parses a complete HTTP/1.x response (Content-Length, chunked or
// close-delimited body). nullopt when the status line or framing is invalid.
std::optional<ProbeResponse> parse_http_response(const std::string &raw);

// Exact name, or prefix when the pattern ends in '*'.
bool interface_matches(const std::string &pattern, const std::string &name);

// First interface in priority order that is up, not loopback and has an
// IPv4 address.
std::optional<LocalNetworkInfo>
select_local_network(const std::vector<InterfaceAddress> &addrs,
                     const std::vector<std::string> &priority);

// "192.168.1.23" -> "192.168.1.0/24"
std::string network_segment(const std::string &ip);
// "192.168.1.23" -> "192.168.1"
std::string subnet_prefix(const std::string &ip);
// Accepts "a.b.c", "a.b.c.", "a.b.c.0/24" or a host address and returns
// "a.b.c". Throws Error(InvalidArgument).
std::string normalize_prefix(const std::string &prefix);
// .1 through .254
std::vector<std::string> candidate_hosts(const std::string &prefix);

// nullopt unless the body is a JSON object with name, websocket_url (ws:// or
// wss://), version and platform strings.
std::optional<ServiceDescriptor>
parse_service_descriptor(const std::string &body);

struct ScanOptions {
  bool preserve_services = false;
};

class ServiceDiscovery {
public:
  ServiceDiscovery(Config cfg, std::shared_ptr<INetworkInterfaces> ifaces,
                   std::shared_ptr<IProbeClient> prober);
  ServiceDiscovery(const ServiceDiscovery &) = delete;
  ServiceDiscovery &operator=(const ServiceDiscovery &) = delete;
  ~ServiceDiscovery();

  std::optional<LocalNetworkInfo> get_local_network_info();

  // Probes every host of the /24 with at most max_concurrent_probes in
  // flight. Blocks until all probes settle or cancel() is called; returns the
  // descriptors collected so far, in no particular order.
  std::vector<ServiceDescriptor> scan(const std::string &prefix,
                                      ScanOptions opts = {});

  // get_local_network_info() + scan(). Throws Error(DiscoveryUnavailable)
  // when no usable interface is found.
  std::vector<ServiceDescriptor> discover(ScanOptions opts = {});

  // Stops dispatching probes for the running scan. Probes in flight are
  // abandoned, not aborted.
  void cancel();

  // Starts one probe task. The default runs each task on a detached thread.
  // A launcher either takes the task or throws without running it.
  using TaskLauncher = std::function<void(std::function<void()>)>;
  void set_task_launcher(TaskLauncher launcher);

  std::vector<ServiceDescriptor> services() const;
  bool is_scanning() const;
  std::string last_error() const;

  const ConcurrencyLimiter &limiter() const { return *limiter_; }

private:
  struct ScanState;

  Config cfg_;
  std::shared_ptr<INetworkInterfaces> ifaces_;
  std::shared_ptr<IProbeClient> prober_;
  std::shared_ptr<ConcurrencyLimiter> limiter_;

  mutable std::mutex mu_;
  std::shared_ptr<ScanState> active_;
  std::vector<ServiceDescriptor> services_;
  std::string last_error_;
  TaskLauncher launcher_;
};

} // namespace visionsync
