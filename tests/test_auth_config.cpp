#include "sg/auth/auth_config.h"

#include <map>
#include <optional>
#include <string>

#include "sg/error.h"
#include "test_helpers.h"

namespace {

sg::auth::AuthConfig::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool RejectsEnv(std::map<std::string, std::string> values) {
  try {
    (void)sg::auth::AuthConfig::FromEnvironment(FakeEnv(std::move(values)));
  } catch (const sg::Error& err) {
    return err.domain == sg::ErrorDomain::Config;
  }
  return false;
}

}  // namespace

int main() {
  using namespace std::chrono_literals;

  auto defaults = sg::auth::AuthConfig::FromEnvironment(FakeEnv({{"HOME", "/home/alex"}}));
  SG_EXPECT(defaults.hash_cost == sg::auth::PasswordHasher::kDefaultCost, "default cost");
  SG_EXPECT(defaults.lockout_threshold == 5, "default threshold");
  SG_EXPECT(defaults.lockout_duration == 15min, "default lockout window");
  SG_EXPECT(defaults.lockout().duration == 900s, "lockout config in seconds");
  SG_EXPECT(defaults.state_dir == "/home/alex/.local/state/sessiongate", "HOME fallback");
  SG_EXPECT(defaults.settings_path() == "/home/alex/.local/state/sessiongate/auth.sgs",
            "settings file name");
  SG_EXPECT(defaults.audit_log_enabled, "audit log on by default");

  auto xdg = sg::auth::AuthConfig::FromEnvironment(
      FakeEnv({{"HOME", "/home/alex"}, {"XDG_STATE_HOME", "/var/state"}}));
  SG_EXPECT(xdg.state_dir == "/var/state/sessiongate", "XDG_STATE_HOME preferred");
  SG_EXPECT(sg::auth::AuthConfig::DefaultStateDir(FakeEnv({})) == ".sessiongate",
            "relative fallback");

  auto tuned = sg::auth::AuthConfig::FromEnvironment(FakeEnv({{"SG_HASH_COST", "4"},
                                                              {"SG_LOCKOUT_THRESHOLD", "3"},
                                                              {"SG_LOCKOUT_MINUTES", "60"},
                                                              {"SG_IDLE_CHECK_SECONDS", "2"},
                                                              {"SG_STATE_DIR", "/tmp/sg"}}));
  SG_EXPECT(tuned.hash_cost == 4, "cost override");
  SG_EXPECT(tuned.lockout_threshold == 3, "threshold override");
  SG_EXPECT(tuned.lockout_duration == 60min, "minutes override");
  SG_EXPECT(tuned.idle_check_interval == 2s, "idle check override");
  SG_EXPECT(tuned.audit_log_path() == "/tmp/sg/audit.log", "state dir override");

  SG_EXPECT(RejectsEnv({{"SG_HASH_COST", "3"}}), "cost below range");
  SG_EXPECT(RejectsEnv({{"SG_HASH_COST", "21"}}), "cost above range");
  SG_EXPECT(RejectsEnv({{"SG_LOCKOUT_THRESHOLD", "0"}}), "zero threshold");
  SG_EXPECT(RejectsEnv({{"SG_LOCKOUT_THRESHOLD", "6"}}), "threshold looser than the default");
  SG_EXPECT(RejectsEnv({{"SG_LOCKOUT_MINUTES", "14"}}), "window shorter than the default");
  SG_EXPECT(sg::auth::AuthConfig::FromEnvironment(FakeEnv({{"SG_LOCKOUT_THRESHOLD", "5"},
                                                          {"SG_LOCKOUT_MINUTES", "15"}}))
                    .lockout()
                    .duration == 900s,
            "defaults themselves accepted");
  SG_EXPECT(RejectsEnv({{"SG_LOCKOUT_MINUTES", "15m"}}), "trailing garbage");
  SG_EXPECT(RejectsEnv({{"SG_IDLE_CHECK_SECONDS", ""}}), "empty value");
  SG_EXPECT(RejectsEnv({{"SG_LOCKOUT_THRESHOLD", "-1"}}), "negative value");

  try {
    sg::auth::ParseConfigNumber("SG_HASH_COST", "99", 4, 20);
    SG_EXPECT(false, "out of range value accepted");
  } catch (const sg::Error& err) {
    SG_EXPECT(std::string(err.what()).find("SG_HASH_COST") != std::string::npos,
              "error names the variable");
  }

  sg::auth::AuthConfig invalid = defaults;
  invalid.state_dir.clear();
  bool threw = false;
  try {
    invalid.Validate();
  } catch (const sg::Error&) {
    threw = true;
  }
  SG_EXPECT(threw, "empty state dir rejected");

  std::cout << "auth config tests ok\n";
  return 0;
}
