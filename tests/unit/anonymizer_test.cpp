#include "anonymizer.hpp"

#include <arpa/inet.h>

#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void TestReferenceAddresses() {
  Anonymizer anonymizer;
  assert(anonymizer.anonymizeIp("1.1.1.1") == "XXX.XXX.XXX.XXX");
  assert(anonymizer.anonymizeIp("10.42.0.1") == "10.XXX.XXX.XXX");
  assert(anonymizer.anonymizeIp("172.16.0.32") == "172.XXX.XXX.XXX");
  assert(anonymizer.anonymizeIp("192.168.0.12") == "192.168.XXX.XXX");
}

void TestPrivateClassBoundaries() {
  assert(Anonymizer::redactIp("10.255.255.255") == "10.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("11.0.0.1") == "XXX.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("172.31.255.254") == "172.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("172.15.0.1") == "XXX.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("172.32.0.1") == "XXX.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("192.168.255.1") == "192.168.XXX.XXX");
  assert(Anonymizer::redactIp("192.169.0.1") == "XXX.XXX.XXX.XXX");
  // special-purpose ranges outside RFC 1918 are not kept
  assert(Anonymizer::redactIp("127.0.0.1") == "XXX.XXX.XXX.XXX");
  assert(Anonymizer::redactIp("169.254.10.20") == "XXX.XXX.XXX.XXX");
}

void TestRedactionFollowsPrefixLength() {
  // kept octets are exactly the whole octets of the matching class prefix
  for (const char* ip : {"10.1.2.3", "172.20.1.2", "192.168.7.8", "0.0.0.0", "255.255.255.255"}) {
    struct in_addr parsed;
    assert(inet_pton(AF_INET, ip, &parsed) == 1);
    unsigned kept = Anonymizer::privatePrefixLength(ntohl(parsed.s_addr)) / 8;
    std::string redacted = Anonymizer::redactIp(ip);
    size_t hidden = 0;
    for (size_t pos = redacted.find("XXX"); pos != std::string::npos; pos = redacted.find("XXX", pos + 1)) {
      ++hidden;
    }
    assert(hidden == 4 - kept);
  }
}

void TestPrefixLengths() {
  assert(Anonymizer::privatePrefixLength(0x0A2A0001u) == 8);   // 10.42.0.1
  assert(Anonymizer::privatePrefixLength(0xAC1F0001u) == 12);  // 172.31.0.1
  assert(Anonymizer::privatePrefixLength(0xC0A80001u) == 16);  // 192.168.0.1
  assert(Anonymizer::privatePrefixLength(0x08080808u) == 0);   // 8.8.8.8
}

void TestInvalidAddressRejected() {
  Anonymizer anonymizer;
  for (const char* bad : {"", "10.0.0", "10.0.0.256", "hostname", "::1"}) {
    bool threw = false;
    try {
      anonymizer.anonymizeIp(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
  assert(anonymizer.cachedIps() == 0);
}

void TestNamePseudonymShape() {
  Anonymizer anonymizer;
  std::string pseudonym = anonymizer.anonymizeName("ALICE-PC");
  assert(EndsWith(pseudonym, Anonymizer::NAME_SUFFIX));
  assert(pseudonym != "ALICE-PC");

  std::string word = pseudonym.substr(0, pseudonym.size() - std::string(Anonymizer::NAME_SUFFIX).size());
  assert(word.size() >= 6);
  for (char c : word) {
    assert(std::isupper(static_cast<unsigned char>(c)));
  }
}

void TestDeterministicAndMemoized() {
  Anonymizer anonymizer;
  const std::string first_name = anonymizer.anonymizeName("BOB-PC");
  const std::string first_ip   = anonymizer.anonymizeIp("192.168.1.7");

  for (int i = 0; i < 10; ++i) {
    assert(anonymizer.anonymizeName("BOB-PC") == first_name);
    assert(anonymizer.anonymizeIp("192.168.1.7") == first_ip);
  }
  assert(anonymizer.cachedNames() == 1);
  assert(anonymizer.cachedIps() == 1);

  // the memo only avoids recomputation
  assert(Anonymizer::pseudonymFor("BOB-PC") == first_name);
  Anonymizer other;
  assert(other.anonymizeName("BOB-PC") == first_name);
}

void TestDifferentNamesUsuallyDiffer() {
  Anonymizer anonymizer;
  assert(anonymizer.anonymizeName("ALICE-PC") != anonymizer.anonymizeName("BOB-PC"));
  assert(anonymizer.anonymizeName("ALICE-PC") != anonymizer.anonymizeName("ALICE-PD"));
  assert(anonymizer.cachedNames() == 3);
}

void TestEmptyName() {
  Anonymizer anonymizer;
  std::string pseudonym = anonymizer.anonymizeName("");
  assert(EndsWith(pseudonym, "-LT"));
  assert(pseudonym.size() > 3);
}

} // namespace

int main() {
  TestReferenceAddresses();
  TestPrivateClassBoundaries();
  TestPrefixLengths();
  TestRedactionFollowsPrefixLength();
  TestInvalidAddressRejected();
  TestNamePseudonymShape();
  TestDeterministicAndMemoized();
  TestDifferentNamesUsuallyDiffer();
  TestEmptyName();

  std::cout << "owl_unit_anonymizer: pass\n";
  return 0;
}
