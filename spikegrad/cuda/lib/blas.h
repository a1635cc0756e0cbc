// Copyright 2025 Erik Garrison. Apache 2.0 License.
//
// Type-dispatched cuBLAS GEMM.

#pragma once

#include <cublas_v2.h>
#include <cuda_fp16.h>

template<typename T>
struct blas {
    struct set_pointer_mode {
        set_pointer_mode(cublasHandle_t handle) : handle_(handle) {
            cublasGetPointerMode(handle_, &old_mode_);
            cublasSetPointerMode(handle_, CUBLAS_POINTER_MODE_HOST);
        }
        ~set_pointer_mode() {
            cublasSetPointerMode(handle_, old_mode_);
        }
    private:
        cublasHandle_t handle_;
        cublasPointerMode_t old_mode_;
    };
};

template<>
struct blas<__half> : public blas<void> {
    static constexpr decltype(cublasHgemm)* gemm = &cublasHgemm;
};

template<>
struct blas<float> : public blas<void> {
    static constexpr decltype(cublasSgemm)* gemm = &cublasSgemm;
};

template<>
struct blas<double> : public blas<void> {
    static constexpr decltype(cublasDgemm)* gemm = &cublasDgemm;
};
