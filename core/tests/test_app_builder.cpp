#include <catch2/catch_test_macros.hpp>
#include <clienv/app_builder.h>
#include "TempDirectory.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace clienv;
namespace fs = std::filesystem;

namespace {

App buildOrFail(const AppBuilder& builder) {
    auto result = builder.build();
    INFO(result.errorText());
    REQUIRE(result.isOk());
    return *result.app();
}

} // namespace

TEST_CASE("AppBuilder creates only the requested directories", "[AppBuilder][directories]") {
    TempDirectory home{"clienv-test-home"};
    TempDirectory working{"clienv-test-local"};
    const Environment environment{home.getPath(), working.getPath()};
    const auto homeDir = home.getPath() / ".test-cli-app";
    const auto localDir = working.getPath() / ".test-cli-app";
    AppBuilder builder(environment);
    builder.appName("test-cli-app");

    SECTION("no directories by default") {
        auto app = buildOrFail(builder);
        CHECK_FALSE(fs::exists(homeDir));
        CHECK_FALSE(fs::exists(localDir));
        CHECK_FALSE(app.hasHomeDir());
        CHECK_FALSE(app.hasLocalDir());
    }

    SECTION("home directory only") {
        auto app = buildOrFail(builder.withHomeDirectory());
        CHECK(fs::is_directory(homeDir));
        CHECK_FALSE(fs::exists(localDir));
        CHECK(app.hasHomeDir());
    }

    SECTION("local directory only") {
        auto app = buildOrFail(builder.withLocalDirectory());
        CHECK_FALSE(fs::exists(homeDir));
        CHECK(fs::is_directory(localDir));
        CHECK(app.hasLocalDir());
    }

    SECTION("both directories") {
        buildOrFail(builder.withHomeDirectory().withLocalDirectory());
        CHECK(fs::is_directory(homeDir));
        CHECK(fs::is_directory(localDir));
    }

    SECTION("existing directories are reused") {
        fs::create_directories(homeDir);
        {
            std::ofstream marker(homeDir / "marker");
            marker << "keep";
        }
        buildOrFail(builder.withHomeDirectory());
        CHECK(fs::exists(homeDir / "marker"));
    }
}

TEST_CASE("AppBuilder derives default paths", "[AppBuilder][paths]") {
    TempDirectory home{"clienv-test-home"};
    TempDirectory working{"clienv-test-local"};
    const Environment environment{home.getPath(), working.getPath()};

    SECTION("default app name") {
        auto app = buildOrFail(AppBuilder(environment));
        CHECK(app.getAppName() == "app");
        CHECK(app.getHomeDir() == home.getPath() / ".app");
        CHECK(app.getLocalDir() == working.getPath() / ".app");
        CHECK(app.getHomePropertiesFile() == home.getPath() / ".app" / "app.properties");
        CHECK(app.getLocalPropertiesFile() == working.getPath() / ".app" / "app.properties");
    }

    SECTION("empty app name falls back to the default") {
        auto app = buildOrFail(AppBuilder(environment).appName(""));
        CHECK(app.getAppName() == "app");
    }

    SECTION("properties file names follow the app name") {
        auto app = buildOrFail(AppBuilder(environment).appName("tool"));
        CHECK(app.getHomePropertiesFile() == home.getPath() / ".tool" / "tool.properties");
        CHECK(app.getLocalPropertiesFile() == working.getPath() / ".tool" / "tool.properties");
    }

    SECTION("explicit properties file names") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .homePropertiesFileName("global.properties")
            .localPropertiesFileName("project.properties"));
        CHECK(app.getHomePropertiesFile().filename() == "global.properties");
        CHECK(app.getLocalPropertiesFile().filename() == "project.properties");
    }

    SECTION("explicit properties file names are escaped") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .homePropertiesFileName("../escape.properties")
            .localPropertiesFileName(".."));
        CHECK(app.getHomePropertiesFile() == home.getPath() / ".tool" / ".._escape.properties");
        CHECK(app.getLocalPropertiesFile() == working.getPath() / ".tool" / "__");
    }

    SECTION("nested properties file names stay inside the app directory") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .homePropertiesFileName("conf/app.properties")
            .localPropertiesFileName(""));
        CHECK(app.getHomePropertiesFile() == home.getPath() / ".tool" / "conf_app.properties");
        CHECK(app.getLocalPropertiesFile() == working.getPath() / ".tool" / "tool.properties");
    }

    SECTION("app names cannot leave the parent directory") {
        auto dotApp = buildOrFail(AppBuilder(environment).appName("."));
        CHECK(dotApp.getHomeDir() == home.getPath() / "._");

        auto traversalApp = buildOrFail(AppBuilder(environment).appName("../../etc"));
        CHECK(traversalApp.getHomeDir() == home.getPath() / "..._.._etc");
        CHECK(traversalApp.getHomeDir().parent_path() == home.getPath());
    }
}

TEST_CASE("AppBuilder applies directory overrides", "[AppBuilder][paths]") {
    TempDirectory home{"clienv-test-home"};
    TempDirectory working{"clienv-test-local"};
    TempDirectory custom{"clienv-test-custom"};
    const Environment environment{home.getPath(), working.getPath()};

    SECTION("explicit home and local directories") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .homeDir(custom.getPath() / "home")
            .localDir(custom.getPath() / "local")
            .withHomeDirectory()
            .withLocalDirectory());
        CHECK(app.getHomeDir() == custom.getPath() / "home");
        CHECK(app.getLocalDir() == custom.getPath() / "local");
        CHECK(app.getHomePropertiesFile() == custom.getPath() / "home" / "tool.properties");
        CHECK(fs::is_directory(custom.getPath() / "home"));
        CHECK(fs::is_directory(custom.getPath() / "local"));
    }

    SECTION("missing ancestors are created") {
        auto nested = custom.getPath() / "a" / "b" / "c";
        buildOrFail(AppBuilder(environment).homeDir(nested).withHomeDirectory());
        CHECK(fs::is_directory(nested));
    }

    SECTION("working directory override moves the local directory") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .withWorkingDirectory(custom.getPath())
            .withLocalDirectory());
        CHECK(app.getLocalDir() == custom.getPath() / ".tool");
        CHECK(fs::is_directory(custom.getPath() / ".tool"));
        CHECK_FALSE(fs::exists(working.getPath() / ".tool"));
        CHECK(app.getHomeDir() == home.getPath() / ".tool");
    }

    SECTION("explicit local directory wins over the working directory override") {
        auto app = buildOrFail(AppBuilder(environment)
            .withWorkingDirectory(custom.getPath())
            .localDir(working.getPath() / "explicit"));
        CHECK(app.getLocalDir() == working.getPath() / "explicit");
    }

    SECTION("relative overrides resolve against the working directory") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .homeDir("config/home")
            .localDir("./config/../local"));
        CHECK(app.getHomeDir() == working.getPath() / "config" / "home");
        CHECK(app.getLocalDir() == working.getPath() / "local");
        CHECK(app.getHomeDir().is_absolute());
    }

    SECTION("environment can be replaced after construction") {
        auto app = buildOrFail(AppBuilder(environment)
            .appName("tool")
            .environment(Environment{custom.getPath(), custom.getPath()}));
        CHECK(app.getHomeDir() == custom.getPath() / ".tool");
        CHECK(app.getLocalDir() == custom.getPath() / ".tool");
    }
}

TEST_CASE("AppBuilder reports directory creation failures", "[AppBuilder][errors]") {
    TempDirectory home{"clienv-test-home"};
    TempDirectory working{"clienv-test-local"};
    const Environment environment{home.getPath(), working.getPath()};

    {
        std::ofstream occupied(home.getPath() / ".blocked");
        occupied << "not a directory";
    }

    auto result = AppBuilder(environment).appName("blocked").withHomeDirectory().withLocalDirectory().build();

    REQUIRE_FALSE(result.isOk());
    CHECK(result.app() == nullptr);
    auto* creationFailed = std::get_if<DirectoryCreationFailedError>(&result.data);
    REQUIRE(creationFailed != nullptr);
    CHECK(creationFailed->directory == home.getPath() / ".blocked");
    CHECK_FALSE(result.errorText().empty());
}

TEST_CASE("AppBuilder reports an unknown environment", "[AppBuilder][errors]") {
    TempDirectory working{"clienv-test-local"};

    SECTION("no home directory") {
        auto result = AppBuilder(Environment{{}, working.getPath()}).build();
        REQUIRE(std::holds_alternative<EnvironmentLookupFailedError>(result.data));
        CHECK(result.errorText() == "Cannot determine user home directory");
    }

    SECTION("home override makes the environment home unnecessary") {
        auto result = AppBuilder(Environment{{}, working.getPath()}).homeDir(working.getPath() / "home").build();
        CHECK(result.isOk());
    }

    SECTION("no working directory") {
        auto result = AppBuilder(Environment{working.getPath(), {}}).build();
        REQUIRE(std::holds_alternative<EnvironmentLookupFailedError>(result.data));
        CHECK(result.errorText() == "Cannot determine working directory");
    }
}

TEST_CASE("Environment::current reflects the process", "[Environment]") {
    auto environment = Environment::current();

    CHECK(environment.workingDirectory == fs::current_path());
    CHECK_FALSE(environment.homeDirectory.empty());
}
