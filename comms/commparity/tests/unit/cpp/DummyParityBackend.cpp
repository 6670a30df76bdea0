// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <string>
#include <string_view>

#include <comms/commparity/ParityBackend.hpp>

namespace {

// Single process backend: the sum over one rank is the input itself.
class DummyParityBackend : public commparity::ParityBackend {
 public:
  void init(
      at::Device /* device */,
      int rank,
      int size,
      const std::string& name,
      const commparity::BackendOptions& /* options */) override {
    rank_ = rank;
    size_ = size;
    name_ = name;
  }
  void finalize() override {}
  int getRank() const override {
    return rank_;
  }
  int getSize() const override {
    return size_;
  }
  std::string_view getBackendName() const override {
    return "dummy";
  }
  std::string_view getCommName() const override {
    return name_;
  }
  void all_reduce(const at::Tensor& input, at::Tensor& output) override {
    if (!output.is_same(input)) {
      output.copy_(input);
    }
  }

 private:
  int rank_{0};
  int size_{1};
  std::string name_;
};

} // namespace

static commparity::ParityBackend* new_backend_impl() {
  return new DummyParityBackend();
}

static void destroy_backend_impl(commparity::ParityBackend* backend) {
  delete backend;
}

static const char* get_supported_version_impl() {
  return commparity::COMMPARITY_BACKEND_ABI_VERSION;
}

extern "C" commparity::DynamicLoaderInterface
create_dynamic_loader_dummy_test() {
  commparity::DynamicLoaderInterface interface{
      .new_backend = new_backend_impl,
      .destroy_backend = destroy_backend_impl,
      .get_supported_version = get_supported_version_impl,
  };
  return interface;
}
