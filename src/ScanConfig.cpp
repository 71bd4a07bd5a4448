#include "ScanConfig.h"

std::vector<PatternRule> default_heuristic_rules() {
    using C = ThreatCategory;
    return {
        // System modification
        { "registry.SetValue",    R"(registry\.SetValue)",     3, C::TROJAN },
        { "Process.Start",        R"(Process\.Start)",         2, C::UNCLASSIFIED },
        { "File.Delete",          R"(File\.Delete)",           2, C::UNCLASSIFIED },
        // Network activity
        { "Socket.Connect",       R"(Socket\.Connect)",        2, C::BACKDOOR },
        { "HttpClient",           R"(Http(Client|Request))",   2, C::BACKDOOR },
        // Encryption
        { "CryptoStream",         R"(Crypto(stream|provider))", 3, C::RANSOMWARE },
        { "Rijndael/AES/RSA",     R"(Rijndael|AES|RSA)",       3, C::RANSOMWARE },
        // Process injection
        { "WriteProcessMemory",   R"(WriteProcessMemory)",     4, C::TROJAN },
        { "CreateRemoteThread",   R"(CreateRemoteThread)",     4, C::TROJAN },
        { "NtCreateThreadEx",     R"(NtCreateThreadEx)",       4, C::TROJAN },
        // Code obfuscation
        { "VirtualAllocEx",       R"(VirtualAllocEx)",         3, C::ROOTKIT },
        { "VirtualProtectEx",     R"(VirtualProtectEx)",       3, C::ROOTKIT },
        // Persistence
        { "Run key",              R"(Run\s*=)",                3, C::TROJAN },
        { "StartupFolder",        R"(StartupFolder)",          3, C::TROJAN },
        // File operations
        { "Executable reference", R"(\.exe|\.dll|\.sys)",      1, C::UNCLASSIFIED },
        { "CreateFile/WriteFile", R"(CreateFile|WriteFile)",   2, C::UNCLASSIFIED },
    };
}

std::vector<std::string> default_suspicious_names() {
    return { "trojan", "hack", "crack", "keygen", "patch", "warez", "virus" };
}

ScanConfig ScanConfig::defaults() {
    ScanConfig c;
    c.heuristic_rules = default_heuristic_rules();
    c.suspicious_names = default_suspicious_names();
    c.signatures = std::make_shared<const SignatureStore>(SignatureStore::builtin());
    return c;
}
