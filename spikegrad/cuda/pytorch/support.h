// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Tensor checks and raw-pointer helpers for the ATen glue.

#pragma once

#include <cuda_fp16.h>
#include <torch/torch.h>

#define CHECK_CUDA(x) TORCH_CHECK(x.options().device().is_cuda(), #x " must be a CUDA tensor")
#define CHECK_CONTIGUOUS(x) TORCH_CHECK(x.is_contiguous(), #x " must be contiguous")
#define CHECK_INPUT(x) CHECK_CUDA(x); CHECK_CONTIGUOUS(x)
#define CHECK_SAME_SIZE(x, y) TORCH_CHECK(x.sizes() == y.sizes(), #x " and " #y " must have the same shape")

template<typename U>
struct native_type {
    using T = U;
};

template<>
struct native_type<c10::Half> {
    using T = __half;
};

template<typename U>
typename native_type<U>::T* ptr(torch::Tensor t) {
    return reinterpret_cast<typename native_type<U>::T*>(t.data_ptr<U>());
}

template<typename U>
typename native_type<U>::T* ptr_or_null(const torch::Tensor& t) {
    return t.defined() ? ptr<U>(t) : nullptr;
}
