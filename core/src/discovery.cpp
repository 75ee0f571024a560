#include "visionsync/discovery.hpp"
#include "visionsync/errors.hpp"
#include "visionsync/logger.hpp"
#include "visionsync/net.hpp"
#include "visionsync/tinyjson.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <condition_variable>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>
#include <thread>

namespace visionsync {

static constexpr size_t kMaxProbeResponse = 64 * 1024;

std::vector<InterfaceAddress> SystemNetworkInterfaces::list_ipv4() {
  ifaddrs *head = nullptr;
  if (getifaddrs(&head) != 0)
    throw Error(ErrorCode::DiscoveryUnavailable,
                "getifaddrs failed: " + net::last_error_text());

  std::vector<InterfaceAddress> out;
  for (ifaddrs *ifa = head; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
      continue;
    char buf[INET_ADDRSTRLEN] = {};
    auto *sin = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
    if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)))
      continue;
    InterfaceAddress a;
    a.name = ifa->ifa_name;
    a.address = buf;
    a.up = (ifa->ifa_flags & IFF_UP) != 0;
    a.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
    out.push_back(std::move(a));
  }
  freeifaddrs(head);
  return out;
}

static std::string lower(std::string s) {
  for (auto &c : s)
    c = (char)std::tolower((unsigned char)c);
  return s;
}

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// nullopt when the chunk framing is incomplete or invalid.
static std::optional<std::string> decode_chunked(const std::string &in) {
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t eol = in.find("\r\n", pos);
    if (eol == std::string::npos)
      return std::nullopt;
    std::string size_line = in.substr(pos, eol - pos);
    size_t semi = size_line.find(';');
    if (semi != std::string::npos)
      size_line = size_line.substr(0, semi);
    size_line = trim(size_line);
    if (size_line.empty() ||
        size_line.find_first_not_of("0123456789abcdefABCDEF") !=
            std::string::npos)
      return std::nullopt;
    size_t n = std::stoul(size_line, nullptr, 16);
    pos = eol + 2;
    if (n == 0)
      return out;
    if (pos + n + 2 > in.size())
      return std::nullopt;
    out.append(in, pos, n);
    pos += n + 2;
  }
}

std::optional<ProbeResponse> parse_http_response(const std::string &raw) {
  size_t hdr_end = raw.find("\r\n\r\n");
  if (hdr_end == std::string::npos)
    return std::nullopt;

  std::istringstream hs(raw.substr(0, hdr_end));
  std::string status_line;
  std::getline(hs, status_line);
  if (status_line.rfind("HTTP/1.", 0) != 0)
    return std::nullopt;
  size_t sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4 > status_line.size())
    return std::nullopt;
  std::string code = status_line.substr(sp + 1, 3);
  if (code.find_first_not_of("0123456789") != std::string::npos)
    return std::nullopt;

  ProbeResponse resp;
  resp.status = std::stoi(code);

  std::optional<size_t> content_length;
  bool chunked = false;
  std::string line;
  while (std::getline(hs, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string key = lower(trim(line.substr(0, colon)));
    std::string val = trim(line.substr(colon + 1));
    if (key == "content-length") {
      if (val.empty() || val.find_first_not_of("0123456789") !=
                             std::string::npos)
        return std::nullopt;
      content_length = std::stoul(val);
    } else if (key == "transfer-encoding" &&
               lower(val).find("chunked") != std::string::npos) {
      chunked = true;
    }
  }

  std::string body = raw.substr(hdr_end + 4);
  if (chunked) {
    auto decoded = decode_chunked(body);
    if (!decoded)
      return std::nullopt;
    resp.body = std::move(*decoded);
  } else if (content_length) {
    if (body.size() < *content_length)
      return std::nullopt;
    resp.body = body.substr(0, *content_length);
  } else {
    resp.body = std::move(body);
  }
  return resp;
}

// True once `raw` holds a whole response per its own framing headers.
static bool response_complete(const std::string &raw) {
  size_t hdr_end = raw.find("\r\n\r\n");
  if (hdr_end == std::string::npos)
    return false;
  std::string headers = lower(raw.substr(0, hdr_end));
  if (headers.find("transfer-encoding: chunked") != std::string::npos)
    return decode_chunked(raw.substr(hdr_end + 4)).has_value();
  auto cl = headers.find("content-length:");
  if (cl == std::string::npos)
    return false;
  size_t n = std::strtoul(headers.c_str() + cl + 15, nullptr, 10);
  return raw.size() - (hdr_end + 4) >= n;
}

std::optional<ProbeResponse>
HttpProbeClient::get(const std::string &host, int port, const std::string &path,
                     std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  net::Socket sock;
  try {
    sock = net::tcp_connect(host, port, timeout);
  } catch (const Error &e) {
    VS_LOG_TRACE(LogCategory::Discovery, e.what());
    return std::nullopt;
  }

  std::string req = "GET " + path + " HTTP/1.1\r\n";
  req += "Host: " + host + ":" + std::to_string(port) + "\r\n";
  req += "Accept: application/json\r\n";
  req += "Connection: close\r\n\r\n";
  if (!net::write_all(sock.fd(), req.data(), req.size()))
    return std::nullopt;

  std::string raw;
  char buf[4096];
  while (!response_complete(raw)) {
    long r = net::read_some(sock.fd(), buf, sizeof(buf), deadline);
    if (r == 0)
      break; // close-delimited body
    if (r < 0)
      return std::nullopt;
    raw.append(buf, (size_t)r);
    if (raw.size() > kMaxProbeResponse)
      return std::nullopt;
  }
  return parse_http_response(raw);
}

bool interface_matches(const std::string &pattern, const std::string &name) {
  if (!pattern.empty() && pattern.back() == '*')
    return name.rfind(pattern.substr(0, pattern.size() - 1), 0) == 0;
  return pattern == name;
}

std::optional<LocalNetworkInfo>
select_local_network(const std::vector<InterfaceAddress> &addrs,
                     const std::vector<std::string> &priority) {
  for (const auto &pattern : priority) {
    for (const auto &a : addrs) {
      if (!a.up || a.loopback || a.address.empty())
        continue;
      if (!interface_matches(pattern, a.name))
        continue;
      return LocalNetworkInfo{a.address, network_segment(a.address), a.name};
    }
  }
  return std::nullopt;
}

static std::vector<int> parse_octets(const std::string &s) {
  std::vector<int> out;
  std::string part;
  std::istringstream ss(s);
  while (std::getline(ss, part, '.')) {
    if (part.empty() || part.size() > 3 ||
        part.find_first_not_of("0123456789") != std::string::npos)
      return {};
    int v = std::stoi(part);
    if (v > 255)
      return {};
    out.push_back(v);
  }
  return out;
}

std::string subnet_prefix(const std::string &ip) {
  auto o = parse_octets(ip);
  if (o.size() != 4)
    throw Error(ErrorCode::InvalidArgument, "not an IPv4 address: " + ip);
  return std::to_string(o[0]) + "." + std::to_string(o[1]) + "." +
         std::to_string(o[2]);
}

std::string network_segment(const std::string &ip) {
  return subnet_prefix(ip) + ".0/24";
}

std::string normalize_prefix(const std::string &prefix) {
  std::string p = prefix;
  auto slash = p.find('/');
  if (slash != std::string::npos) {
    if (p.substr(slash) != "/24")
      throw Error(ErrorCode::InvalidArgument, "only /24 is supported: " + p);
    p = p.substr(0, slash);
  }
  if (!p.empty() && p.back() == '.')
    p.pop_back();
  auto o = parse_octets(p);
  if (o.size() == 4)
    return subnet_prefix(p);
  if (o.size() != 3)
    throw Error(ErrorCode::InvalidArgument, "bad subnet prefix: " + prefix);
  return p;
}

std::vector<std::string> candidate_hosts(const std::string &prefix) {
  std::string base = normalize_prefix(prefix);
  std::vector<std::string> out;
  out.reserve(254);
  for (int i = 1; i <= 254; ++i)
    out.push_back(base + "." + std::to_string(i));
  return out;
}

std::optional<ServiceDescriptor>
parse_service_descriptor(const std::string &body) {
  json::Value v;
  try {
    v = json::parse(body);
  } catch (const json::ParseError &) {
    return std::nullopt;
  }
  if (!v.is_obj())
    return std::nullopt;
  const auto &o = v.as_obj();
  auto name = json::get_str(o, "name");
  auto url = json::get_str(o, "websocket_url");
  auto version = json::get_str(o, "version");
  auto platform = json::get_str(o, "platform");
  if (!name || !url || !version || !platform)
    return std::nullopt;
  if (url->rfind("ws://", 0) != 0 && url->rfind("wss://", 0) != 0)
    return std::nullopt;

  ServiceDescriptor d;
  d.name = *name;
  d.websocket_url = *url;
  d.version = *version;
  d.platform = *platform;
  d.app = json::get_str(o, "app").value_or("");
  d.capabilities = json::get_str_list(o, "capabilities");
  return d;
}

struct ServiceDiscovery::ScanState {
  std::mutex mu;
  std::condition_variable cv;
  std::vector<ServiceDescriptor> found;
  size_t pending = 0;
  std::atomic<bool> cancelled{false};
};

static void add_unique(std::vector<ServiceDescriptor> &list,
                       const ServiceDescriptor &d) {
  if (std::find(list.begin(), list.end(), d) == list.end())
    list.push_back(d);
}

ServiceDiscovery::ServiceDiscovery(Config cfg,
                                   std::shared_ptr<INetworkInterfaces> ifaces,
                                   std::shared_ptr<IProbeClient> prober)
    : cfg_(std::move(cfg)), ifaces_(std::move(ifaces)),
      prober_(std::move(prober)),
      limiter_(std::make_shared<ConcurrencyLimiter>(
          cfg_.max_concurrent_probes)) {}

ServiceDiscovery::~ServiceDiscovery() { cancel(); }

std::optional<LocalNetworkInfo> ServiceDiscovery::get_local_network_info() {
  std::vector<InterfaceAddress> addrs;
  try {
    addrs = ifaces_->list_ipv4();
  } catch (const Error &e) {
    VS_LOG_ERROR(LogCategory::Discovery, e.what());
    return std::nullopt;
  }
  auto info = select_local_network(addrs, cfg_.interface_priority);
  if (info)
    VS_LOG_INFO(LogCategory::Discovery,
                "Local network: " + info->address + " on " +
                    info->interface_name + " (" + info->subnet_prefix + ")");
  return info;
}

std::vector<ServiceDescriptor> ServiceDiscovery::scan(const std::string &prefix,
                                                      ScanOptions opts) {
  std::string base = normalize_prefix(prefix);
  auto st = std::make_shared<ScanState>();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (active_) {
      VS_LOG_WARN(LogCategory::Discovery, "Scan already in progress");
      return services_;
    }
    active_ = st;
  }

  VS_LOG_INFO(LogCategory::Discovery,
              "Scanning " + base + ".1-254 on port " +
                  std::to_string(cfg_.discovery_port));

  auto limiter = limiter_;
  auto prober = prober_;
  TaskLauncher launch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    launch = launcher_;
  }
  if (!launch)
    launch = [](std::function<void()> task) {
      std::thread(std::move(task)).detach();
    };
  std::string launch_error;
  const int port = cfg_.discovery_port;
  const std::string path = cfg_.discovery_path;
  const auto timeout = cfg_.probe_timeout;

  for (const auto &host : candidate_hosts(base)) {
    if (st->cancelled.load())
      break;
    if (!limiter->acquire(&st->cancelled))
      break;
    {
      std::lock_guard<std::mutex> lk(st->mu);
      st->pending++;
    }
    auto probe = [st, limiter, prober, host, port, path, timeout] {
      Permit permit(limiter.get());
      std::optional<ServiceDescriptor> desc;
      try {
        auto resp = prober->get(host, port, path, timeout);
        if (resp && resp->status == 200)
          desc = parse_service_descriptor(resp->body);
        else if (resp)
          VS_LOG_TRACE(LogCategory::Discovery,
                       host + " answered HTTP " + std::to_string(resp->status));
      } catch (const std::exception &e) {
        VS_LOG_TRACE(LogCategory::Discovery, host + ": " + e.what());
      }
      permit.reset();

      std::lock_guard<std::mutex> lk(st->mu);
      if (desc && !st->cancelled.load()) {
        VS_LOG_INFO(LogCategory::Discovery,
                    "Found " + desc->name + " at " + desc->websocket_url);
        add_unique(st->found, *desc);
      }
      st->pending--;
      st->cv.notify_all();
    };
    try {
      launch(std::move(probe));
    } catch (const std::exception &e) {
      // The task never ran: give back its permit and stop dispatching.
      limiter->release();
      {
        std::lock_guard<std::mutex> lk(st->mu);
        st->pending--;
      }
      launch_error = std::string("Cannot start probe: ") + e.what();
      VS_LOG_ERROR(LogCategory::Discovery, launch_error);
      break;
    }
  }

  std::vector<ServiceDescriptor> results;
  {
    std::unique_lock<std::mutex> lk(st->mu);
    st->cv.wait(lk,
                [&] { return st->pending == 0 || st->cancelled.load(); });
    results = st->found;
  }

  std::lock_guard<std::mutex> lk(mu_);
  active_.reset();
  if (!launch_error.empty())
    last_error_ = launch_error;
  if (opts.preserve_services) {
    for (const auto &d : results)
      add_unique(services_, d);
  } else {
    services_ = results;
  }
  VS_LOG_INFO(LogCategory::Discovery,
              std::string(st->cancelled.load() ? "Scan cancelled: " : "Scan complete: ") +
                  std::to_string(results.size()) + " service(s)");
  return results;
}

void ServiceDiscovery::set_task_launcher(TaskLauncher launcher) {
  std::lock_guard<std::mutex> lk(mu_);
  launcher_ = std::move(launcher);
}

std::vector<ServiceDescriptor> ServiceDiscovery::discover(ScanOptions opts) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_error_.clear();
  }
  auto info = get_local_network_info();
  if (!info) {
    const std::string msg = "Could not determine local network";
    {
      std::lock_guard<std::mutex> lk(mu_);
      last_error_ = msg;
    }
    VS_LOG_ERROR(LogCategory::Discovery, msg);
    throw Error(ErrorCode::DiscoveryUnavailable, msg);
  }
  return scan(info->subnet_prefix, opts);
}

void ServiceDiscovery::cancel() {
  std::shared_ptr<ScanState> st;
  {
    std::lock_guard<std::mutex> lk(mu_);
    st = active_;
  }
  if (!st)
    return;
  {
    std::lock_guard<std::mutex> lk(st->mu);
    st->cancelled = true;
  }
  st->cv.notify_all();
  limiter_->interrupt();
}

std::vector<ServiceDescriptor> ServiceDiscovery::services() const {
  std::lock_guard<std::mutex> lk(mu_);
  return services_;
}

bool ServiceDiscovery::is_scanning() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_ != nullptr;
}

std::string ServiceDiscovery::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

} // namespace visionsync
