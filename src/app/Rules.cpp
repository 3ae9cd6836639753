#include "app/Rules.hpp"
#include "util/Strings.hpp"

namespace vigil::app {

auto default_rules() -> DetectionRules {
  DetectionRules r;
  r.name_tokens = {
    "mimikatz", "psexec", "procdump", "pwdump", "lazagne", "meterpreter", "cobaltstrike",
    "bloodhound", "sharphound", "rubeus", "kerberoast", "xmrig", "cpuminer", "minerd",
    "cryptonight", "hashcat", "responder", "crackmapexec", "netcat", "ncat", "masscan"
  };
  r.tool_names = {"nc", "ncat", "netcat", "socat", "nmap", "masscan", "hydra", "john", "chisel", "ngrok"};
  r.suspicious_dirs = {"/tmp/", "/var/tmp/", "/dev/shm/"};
  r.dropper_extensions = {".exe", ".dll", ".bat", ".ps1", ".vbs", ".scr", ".hta", ".elf", ".bin"};
  r.script_extensions = {".sh", ".py", ".rb", ".pl", ".php", ".js"};
  r.binary_extensions = {".exe", ".dll", ".elf", ".bin", ".so"};
  r.suspicious_ports = {
    4444, 4445, 5555, 6666, 6667, 6668, 6669, 6697, 31337, 12345, 54321,
    1080, 1081, 1082, 1083, 1084, 1085, 3128, 9001, 9002
  };
  r.web_ports = {80, 443, 8080, 8443};
  r.interpreters = {"bash", "sh", "dash", "zsh", "ksh", "python", "python2", "python3",
                    "perl", "ruby", "php", "powershell", "pwsh", "node"};
  r.content_patterns = {
    "wget http", "curl http", "base64 -d", "| bash", "|bash", "| sh", "nc -e",
    "/dev/tcp/", "mkfifo /tmp/", "stratum+tcp://", "chmod 777 /tmp", "python -c 'import socket"
  };
  r.vulnerabilities = {
    {"openssl", "1.0.1", true, "CVE-2014-0160", "Heartbleed"},
    {"openssl", "1.0.2", true, "CVE-2016-0800", "DROWN"},
    {"bash", "4.3", true, "CVE-2014-6271", "Shellshock"},
    {"openssh-server", "7.2", true, "CVE-2016-6210", "OpenSSH user enumeration"},
    {"apache2", "2.4.49", false, "CVE-2021-41773", "Apache path traversal"},
    {"nginx", "1.13", true, "CVE-2017-7529", "nginx range filter overflow"},
    {"sudo", "1.8", true, "CVE-2021-3156", "Baron Samedit"},
    {"policykit-1", "0.105", true, "CVE-2021-4034", "PwnKit"},
  };
  return r;
}

auto rules_from_config(const AgentConfig& cfg) -> DetectionRules {
  DetectionRules r = default_rules();
  if (!cfg.suspicious_directories.empty()) {
    r.suspicious_dirs.clear();
    for (auto d : cfg.suspicious_directories) {
      d = vigil::util::to_lower_copy(d);
      if (d.empty()) continue;
      if (d.back() != '/') d.push_back('/');
      r.suspicious_dirs.push_back(std::move(d));
    }
  }
  r.cpu_alert_threshold = cfg.cpu_alert_threshold;
  r.scan_content = cfg.capabilities.malware_scanning;
  return r;
}

} // namespace vigil::app
