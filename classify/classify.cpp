// classify/classify.cpp
#include "classify/classify.h"
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include "common/log.h"

#ifdef _OPENMP
#include <omp.h>
#endif

#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif

namespace
{
  // Logistic model exported from the offline ensemble.
  constexpr float kW[CLS_FEATURES] = {-3.2f, -0.8f, -2.4f, 0.6f, -0.5f, -0.4f};
  constexpr float kBias = 2.6f;

  // One work item per report row; NF is set at build time.
  const char *kKernelSrc = R"CLC(
__kernel void fake_prob(__global const float *rows,
                        __constant float *w,
                        const float b,
                        const uint n,
                        __global float *p)
{
  const uint i = get_global_id(0);
  if (i >= n)
    return;
  __global const float *row = rows + i * NF;
  float z = b;
  for (int k = 0; k < NF; ++k)
    z = fma(row[k], w[k], z);
  p[i] = 1.0f / (1.0f + exp(-z));
}
)CLC";

  float logistic(const ClsFeatures &x)
  {
    float z = kBias;
    for (int j = 0; j < CLS_FEATURES; ++j)
      z += x.f[j] * kW[j];
    return std::clamp(1.f / (1.f + std::exp(-z)), 0.f, 1.f);
  }
} // namespace

ClsFeatures make_features(const ScoreInput &in, double rsu_distance, double rsu_radius, size_t in_range)
{
  ClsFeatures x{};
  x.f[0] = static_cast<float>(in.reputation);
  x.f[1] = static_cast<float>(std::min<uint32_t>(in.witnesses, 4));
  x.f[2] = in.has_position ? static_cast<float>(1.0 / (1.0 + in.reporter_distance / 100.0)) : 0.5f;
  x.f[3] = rsu_radius > 0.0 ? static_cast<float>(rsu_distance / rsu_radius) : 0.f;
  x.f[4] = static_cast<float>(in.witnesses) / static_cast<float>(std::max<size_t>(1, in_range));
  x.f[5] = in.has_position ? 1.f : 0.f;
  return x;
}

// Every handle is released by the destructor, whatever stage set it up.
struct Classifier::ClCtx
{
  cl_context ctx{};
  cl_device_id device{};
  cl_command_queue q{};
  cl_program prog{};
  cl_kernel kern{};
  cl_mem weights{};
  cl_mem rows{}, probs{};
  size_t rows_cap = 0;

  ClCtx() = default;
  ClCtx(const ClCtx &) = delete;
  ClCtx &operator=(const ClCtx &) = delete;

  ~ClCtx()
  {
    drop_batch();
    release(weights, clReleaseMemObject);
    release(kern, clReleaseKernel);
    release(prog, clReleaseProgram);
    release(q, clReleaseCommandQueue);
    release(ctx, clReleaseContext);
  }

  template <typename H, typename F>
  static void release(H &h, F fn)
  {
    if (h)
      fn(h);
    h = nullptr;
  }

  void drop_batch()
  {
    release(rows, clReleaseMemObject);
    release(probs, clReleaseMemObject);
    rows_cap = 0;
  }

  // Context, queue, kernel and the constant weight buffer on `dev`.
  bool build(cl_device_id dev)
  {
    cl_int err = CL_SUCCESS;
    device = dev;
    ctx = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    if (err != CL_SUCCESS)
      return false;
    q = clCreateCommandQueue(ctx, device, 0, &err);
    if (err != CL_SUCCESS)
      return false;

    const char *src = kKernelSrc;
    prog = clCreateProgramWithSource(ctx, 1, &src, nullptr, &err);
    if (err != CL_SUCCESS)
      return false;
    const std::string opts = "-DNF=" + std::to_string(CLS_FEATURES);
    if (clBuildProgram(prog, 1, &device, opts.c_str(), nullptr, nullptr) != CL_SUCCESS)
    {
      size_t sz = 0;
      if (clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &sz) == CL_SUCCESS && sz > 1)
      {
        std::string log(sz, '\0');
        if (clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, sz, log.data(), nullptr) == CL_SUCCESS)
          LOG("[CLASSIFY] kernel build failed:\n%s", log.c_str());
      }
      return false;
    }
    kern = clCreateKernel(prog, "fake_prob", &err);
    if (err != CL_SUCCESS)
      return false;

    weights = clCreateBuffer(ctx, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, sizeof(kW),
                             const_cast<float *>(kW), &err);
    if (err != CL_SUCCESS)
      return false;
    const float b = kBias;
    return clSetKernelArg(kern, 1, sizeof(cl_mem), &weights) == CL_SUCCESS &&
           clSetKernelArg(kern, 2, sizeof(float), &b) == CL_SUCCESS;
  }

  bool reserve(size_t n)
  {
    if (rows_cap >= n)
      return true;
    drop_batch();
    cl_int err = CL_SUCCESS;
    rows = clCreateBuffer(ctx, CL_MEM_READ_ONLY, sizeof(ClsFeatures) * n, nullptr, &err);
    if (err != CL_SUCCESS)
      return false;
    probs = clCreateBuffer(ctx, CL_MEM_WRITE_ONLY, sizeof(float) * n, nullptr, &err);
    if (err != CL_SUCCESS)
      return false;
    rows_cap = n;
    return clSetKernelArg(kern, 0, sizeof(cl_mem), &rows) == CL_SUCCESS &&
           clSetKernelArg(kern, 4, sizeof(cl_mem), &probs) == CL_SUCCESS;
  }
};

Classifier::Classifier(const ClsConfig &c) : cfg_(c) { init_opencl_if_possible(); }

Classifier::~Classifier() = default;

void Classifier::init_opencl_if_possible()
{
  if (!cfg_.prefer_opencl)
    return;

  cl_uint np = 0;
  if (clGetPlatformIDs(0, nullptr, &np) != CL_SUCCESS || np == 0)
    return;
  std::vector<cl_platform_id> plats(np);
  if (clGetPlatformIDs(np, plats.data(), nullptr) != CL_SUCCESS)
    return;

  for (auto p : plats)
  {
    cl_device_id dev{};
    cl_uint nd = 0;
    if (clGetDeviceIDs(p, CL_DEVICE_TYPE_GPU | CL_DEVICE_TYPE_ACCELERATOR, 1, &dev, &nd) != CL_SUCCESS || nd == 0)
      continue;
    auto ctx = std::make_unique<ClCtx>();
    if (!ctx->build(dev))
      continue;
    cl_ = std::move(ctx);
    LOG("[CLASSIFY] using OpenCL device");
    return;
  }
  LOG("[CLASSIFY] no usable OpenCL device, scoring on the CPU");
}

void Classifier::cpu_predict(const std::vector<ClsFeatures> &feats, std::vector<float> &out)
{
  out.resize(feats.size());

#pragma omp parallel for
  for (int i = 0; i < static_cast<int>(feats.size()); ++i)
    out[i] = logistic(feats[i]);
}

bool Classifier::run_device(const std::vector<ClsFeatures> &feats, std::vector<float> &out)
{
  // ClsFeatures is a plain float[F], rows are contiguous.
  static_assert(sizeof(ClsFeatures) == sizeof(float) * CLS_FEATURES, "ClsFeatures must be packed");
  const size_t n = feats.size();
  if (!cl_->reserve(n))
  {
    cl_->drop_batch();
    return false;
  }

  const cl_uint rows = static_cast<cl_uint>(n);
  if (clSetKernelArg(cl_->kern, 3, sizeof(cl_uint), &rows) != CL_SUCCESS ||
      clEnqueueWriteBuffer(cl_->q, cl_->rows, CL_FALSE, 0, sizeof(ClsFeatures) * n, feats.data(), 0, nullptr, nullptr) != CL_SUCCESS ||
      clEnqueueNDRangeKernel(cl_->q, cl_->kern, 1, nullptr, &n, nullptr, 0, nullptr, nullptr) != CL_SUCCESS)
    return false;

  out.resize(n);
  if (clEnqueueReadBuffer(cl_->q, cl_->probs, CL_TRUE, 0, sizeof(float) * n, out.data(), 0, nullptr, nullptr) != CL_SUCCESS)
    return false;
  for (auto &y : out)
    y = std::clamp(y, 0.f, 1.f);
  return true;
}

void Classifier::predict_batch(const std::vector<ClsFeatures> &feats, std::vector<float> &out)
{
  if (cl_ && !feats.empty() && run_device(feats, out))
    return;
  cpu_predict(feats, out);
}
