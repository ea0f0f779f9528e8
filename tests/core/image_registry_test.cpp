#include "timebox/core/errors.hpp"
#include "timebox/core/image_registry.hpp"
#include "../mocks/mock_container_engine.hpp"

#include <gtest/gtest.h>

using namespace timebox::core;
using timebox::testing::MakeImage;
using timebox::testing::MockContainerEngine;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

std::map<std::string, RuntimeProfile> PythonProfiles() {
    return {{"python", RuntimeProfile{"python-with-time", {"python", "{file}"}, "client_script.py"}}};
}

} // namespace

TEST(ImageRegistryTest, PinsTagToImageId) {
    NiceMock<MockContainerEngine> engine;
    EXPECT_CALL(engine, InspectImage("python-with-time"))
        .WillOnce(Return(MakeImage("python-with-time", "sha256:abc123")));

    ImageRegistry registry(engine, PythonProfiles());
    const auto& handle = registry.ResolveRuntimeImage("python");

    EXPECT_EQ(handle.runtime, "python");
    EXPECT_EQ(handle.tag, "python-with-time");
    EXPECT_EQ(handle.pinned_id, "sha256:abc123");
    EXPECT_EQ(handle.entry_file, "client_script.py");
    EXPECT_EQ(&registry.Get("python"), &handle);
}

TEST(ImageRegistryTest, ResolvesOnlyOnce) {
    NiceMock<MockContainerEngine> engine;
    EXPECT_CALL(engine, InspectImage(_))
        .Times(1)
        .WillOnce(Return(MakeImage("python-with-time", "sha256:first")));

    ImageRegistry registry(engine, PythonProfiles());
    registry.ResolveAll();
    registry.ResolveRuntimeImage("python");

    // A retag on the engine does not move an existing pin
    EXPECT_EQ(registry.Get("python").pinned_id, "sha256:first");
    EXPECT_EQ(registry.ResolvedImages().size(), 1u);
}

TEST(ImageRegistryTest, MissingImageIsFatal) {
    NiceMock<MockContainerEngine> engine;
    ON_CALL(engine, InspectImage(_)).WillByDefault(Return(std::nullopt));

    ImageRegistry registry(engine, PythonProfiles());
    try {
        registry.ResolveAll();
        FAIL() << "expected ImageNotFoundError";
    } catch (const ImageNotFoundError& e) {
        EXPECT_EQ(e.GetRuntime(), "python");
        EXPECT_EQ(e.GetTag(), "python-with-time");
    }
    EXPECT_TRUE(registry.ResolvedImages().empty());
}

TEST(ImageRegistryTest, EngineErrorsPropagate) {
    NiceMock<MockContainerEngine> engine;
    ON_CALL(engine, InspectImage(_))
        .WillByDefault(Throw(InfrastructureFailure("daemon unreachable")));

    ImageRegistry registry(engine, PythonProfiles());
    EXPECT_THROW(registry.ResolveAll(), InfrastructureFailure);
}

TEST(ImageRegistryTest, UnknownRuntimeIsInvalidRequest) {
    NiceMock<MockContainerEngine> engine;
    EXPECT_CALL(engine, InspectImage(_)).Times(0);

    ImageRegistry registry(engine, PythonProfiles());
    EXPECT_THROW(registry.ResolveRuntimeImage("ruby"), InvalidRequestError);
    EXPECT_THROW(registry.Get("ruby"), InvalidRequestError);
    EXPECT_THROW(registry.Get("python"), InvalidRequestError);
}

TEST(ImageRegistryTest, ListsConfiguredRuntimes) {
    NiceMock<MockContainerEngine> engine;
    auto profiles = PythonProfiles();
    profiles["sh"] = RuntimeProfile{"sh", {"{image}", "{file}"}, "main.sh"};

    ImageRegistry registry(engine, profiles);
    EXPECT_EQ(registry.ListRuntimes(), (std::vector<std::string>{"python", "sh"}));
}

TEST(ImageRegistryTest, ExpandsCommandPlaceholders) {
    ImageHandle handle;
    handle.pinned_id = "/usr/bin/python3";
    handle.entry_file = "client_script.py";
    handle.command = {"{image}", "-I", "{file}", "--name={file}"};

    EXPECT_EQ(ImageRegistry::ExpandCommand(handle),
              (std::vector<std::string>{"/usr/bin/python3", "-I", "client_script.py",
                                        "--name=client_script.py"}));
}
