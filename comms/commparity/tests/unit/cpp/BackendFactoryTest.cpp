// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "comms/commparity/BackendFactory.hpp"

using ::testing::HasSubstr;

namespace commparity::test {

namespace {
// Backend name must match the exported symbol in the dummy backend library
constexpr const char* kBackendName = "dummy_test";
constexpr const char* kBackendEnvKey = "COMMPARITY_BACKEND_LIB_PATH_DUMMY_TEST";

class RecordingBackend : public ParityBackend {
 public:
  void init(
      at::Device /* device */,
      int rank,
      int size,
      const std::string& name,
      const BackendOptions& options) override {
    rank_ = rank;
    size_ = size;
    name_ = name;
    timeout_ = options.timeout;
  }
  void finalize() override {}
  int getRank() const override {
    return rank_;
  }
  int getSize() const override {
    return size_;
  }
  std::string_view getBackendName() const override {
    return "recording";
  }
  std::string_view getCommName() const override {
    return name_;
  }
  void all_reduce(const at::Tensor& /* input */, at::Tensor& /* output */)
      override {}

  std::chrono::milliseconds timeout_{0};

 private:
  int rank_{-1};
  int size_{-1};
  std::string name_;
};

std::shared_ptr<RecordingBackend> last_recording_backend;
} // namespace

class BackendFactoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setenv(kBackendEnvKey, COMMPARITY_DUMMY_BACKEND_LIB_PATH, 1);
  }

  void TearDown() override {
    unsetenv(kBackendEnvKey);
  }

  // Helper to get a unique backend name for error tests (avoids cache)
  static std::string getUniqueBackendName() {
    const auto* test_info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    return std::string("test_") + test_info->name();
  }

  static std::string envKeyFor(const std::string& backend) {
    std::string key = "COMMPARITY_BACKEND_LIB_PATH_";
    for (char c : backend) {
      key.push_back(static_cast<char>(std::toupper(c)));
    }
    return key;
  }
};

TEST_F(BackendFactoryTest, CreateGenericBackend) {
  at::Device device(at::kCPU);

  auto backend = BackendFactory::get().create_backend(
      kBackendName, device, 0, 1, "active");
  ASSERT_NE(backend, nullptr);

  EXPECT_EQ(backend->getRank(), 0);
  EXPECT_EQ(backend->getSize(), 1);
  EXPECT_EQ(backend->getBackendName(), "dummy");
  EXPECT_EQ(backend->getCommName(), "active");
}

TEST_F(BackendFactoryTest, GenericBackendAllReduce) {
  auto backend = BackendFactory::get().create_backend(
      kBackendName, at::Device(at::kCPU), 0, 1, "active");
  ASSERT_NE(backend, nullptr);

  auto input = at::arange(8, at::kFloat);
  auto output = at::zeros({8}, at::kFloat);
  backend->all_reduce(input, output);
  EXPECT_TRUE(output.equal(input));

  // In-place
  auto inplace = at::arange(8, at::kFloat);
  backend->all_reduce(inplace, inplace);
  EXPECT_TRUE(inplace.equal(input));
}

TEST_F(BackendFactoryTest, PluginStaysLoadedAcrossInstances) {
  auto first = BackendFactory::get().create_backend(
      kBackendName, at::Device(at::kCPU), 0, 1, "first");
  auto second = BackendFactory::get().create_backend(
      kBackendName, at::Device(at::kCPU), 0, 1, "second");
  first.reset();
  EXPECT_EQ(second->getCommName(), "second");
}

TEST_F(BackendFactoryTest, UnsupportedBackend) {
  EXPECT_THROW(
      BackendFactory::get().create_backend(
          "unsupported", at::Device(at::kCPU), 0, 1, "active"),
      std::runtime_error);
}

TEST_F(BackendFactoryTest, MissingEnvironmentVariable) {
  // Use a unique backend name to avoid hitting the cache from other tests
  std::string unique_backend = getUniqueBackendName();
  unsetenv(envKeyFor(unique_backend).c_str());

  try {
    BackendFactory::get().create_backend(
        unique_backend, at::Device(at::kCPU), 0, 1, "active");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr(envKeyFor(unique_backend)));
    EXPECT_THAT(e.what(), HasSubstr("not set"));
  }
}

TEST_F(BackendFactoryTest, InvalidLibraryPath) {
  std::string unique_backend = getUniqueBackendName();
  auto env_key = envKeyFor(unique_backend);
  setenv(env_key.c_str(), "/nonexistent/libcommparity_missing.so", 1);

  try {
    BackendFactory::get().create_backend(
        unique_backend, at::Device(at::kCPU), 0, 1, "active");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("Failed to load backend library"));
  }
  unsetenv(env_key.c_str());
}

TEST_F(BackendFactoryTest, MissingLoaderSymbol) {
  // The dummy library only exports create_dynamic_loader_dummy_test
  std::string unique_backend = getUniqueBackendName();
  auto env_key = envKeyFor(unique_backend);
  setenv(env_key.c_str(), COMMPARITY_DUMMY_BACKEND_LIB_PATH, 1);

  try {
    BackendFactory::get().create_backend(
        unique_backend, at::Device(at::kCPU), 0, 1, "active");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(
        e.what(),
        HasSubstr("Failed to load function create_dynamic_loader_" +
                  unique_backend));
  }
  unsetenv(env_key.c_str());
}

TEST_F(BackendFactoryTest, RegisteredBackendIsInitialized) {
  BackendFactory::get().register_backend("recording_test", []() {
    last_recording_backend = std::make_shared<RecordingBackend>();
    return last_recording_backend;
  });
  ASSERT_TRUE(BackendFactory::get().is_registered("recording_test"));

  BackendOptions options;
  options.timeout = std::chrono::milliseconds(1234);
  auto backend = BackendFactory::get().create_backend(
      "recording_test", at::Device(at::kCPU), 3, 8, "reference", options);

  ASSERT_EQ(backend, last_recording_backend);
  EXPECT_EQ(backend->getRank(), 3);
  EXPECT_EQ(backend->getSize(), 8);
  EXPECT_EQ(backend->getCommName(), "reference");
  EXPECT_EQ(last_recording_backend->timeout_, std::chrono::milliseconds(1234));
}

TEST_F(BackendFactoryTest, NullFactoryResultThrows) {
  BackendFactory::get().register_backend(
      "null_test", []() { return std::shared_ptr<ParityBackend>(); });
  EXPECT_THROW(
      BackendFactory::get().create_backend(
          "null_test", at::Device(at::kCPU), 0, 1, "active"),
      std::runtime_error);
}

TEST_F(BackendFactoryTest, BuiltinBackendsAreRegistered) {
  EXPECT_TRUE(BackendFactory::get().is_registered("gloo"));
  EXPECT_TRUE(BackendFactory::get().is_registered("nccl"));
  EXPECT_FALSE(BackendFactory::get().is_registered(kBackendName));
}

} // namespace commparity::test
