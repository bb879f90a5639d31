#include "sg/auth/recovery_key.h"

#include <cctype>
#include <set>
#include <string>

#include "test_helpers.h"

int main() {
  // Generated keys are grouped 4x4 from the unambiguous alphabet.
  std::set<std::string> seen;
  for (int i = 0; i < 32; ++i) {
    const std::string key = sg::auth::GenerateRecoveryKeyText();
    SG_EXPECT(key.size() == sg::auth::kRecoveryKeyTextLength, "grouped length");
    for (size_t pos = 0; pos < key.size(); ++pos) {
      if (pos % 5 == 4) {
        SG_EXPECT(key[pos] == '-', "separator at " << pos);
      } else {
        SG_EXPECT(sg::auth::kRecoveryAlphabet.find(key[pos]) != std::string_view::npos,
                  "symbol outside alphabet: " << key[pos]);
      }
    }
    SG_EXPECT(key.find_first_of("OI01") == std::string::npos, "ambiguous symbols excluded");
    seen.insert(key);
  }
  SG_EXPECT(seen.size() == 32, "keys are unique");

  // Normalization.
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("ABCD-EFGH-JKLM-NPQR") == "ABCD-EFGH-JKLM-NPQR",
            "canonical form kept");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("  abcd-efgh-jklm-npqr\n") == "ABCD-EFGH-JKLM-NPQR",
            "case and whitespace");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("abcdefghjklmnpqr") == "ABCD-EFGH-JKLM-NPQR",
            "ungrouped form");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("ABCD-EFGH-JKLM-NPQO").empty(), "letter O rejected");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("ABCD EFGH JKLM NPQR").empty(), "spaces as separators");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("ABCD-EFGH-JKLM").empty(), "too short");
  SG_EXPECT(sg::auth::NormalizeRecoveryKey("").empty(), "empty");

  // Issue and redeem.
  sg::auth::PasswordHasher hasher(4);
  sg::auth::RecoveryFlow flow(hasher);
  auto first = flow.Issue();
  SG_EXPECT(first.Plaintext().size() == sg::auth::kRecoveryKeyTextLength, "plaintext issued");
  SG_EXPECT(first.Hash().rfind(sg::auth::PasswordHasher::kPrefix, 0) == 0, "hash format");
  SG_EXPECT(flow.Redeem(first.Plaintext(), first.Hash()), "issued key redeems");

  std::string lowered(first.Plaintext());
  for (auto& ch : lowered) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  SG_EXPECT(flow.Redeem(lowered, first.Hash()), "lower case redeems");
  SG_EXPECT(!flow.Redeem("not a key", first.Hash()), "garbage rejected");

  // A reissued key replaces the old hash; the old plaintext no longer matches.
  auto second = flow.Issue();
  SG_EXPECT(second.Plaintext() != first.Plaintext(), "fresh key");
  SG_EXPECT(!flow.Redeem(first.Plaintext(), second.Hash()), "old key invalid after reissue");
  SG_EXPECT(flow.Redeem(second.Plaintext(), second.Hash()), "new key redeems");

  // Moving transfers ownership and empties the source.
  const std::string plaintext(second.Plaintext());
  sg::auth::IssuedRecoveryKey moved(std::move(second));
  SG_EXPECT(moved.Plaintext() == plaintext, "moved plaintext");
  SG_EXPECT(second.Plaintext().empty(), "moved-from key wiped");

  std::cout << "recovery key tests ok\n";
  return 0;
}
