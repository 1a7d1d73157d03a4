/**
 * @file gpu_compute.cpp
 * @brief OpenGL compute shader plumbing using Raylib's rlgl.
 *
 * Raylib includes OpenGL function loading via GLAD internally.
 * We use rlgl headers which expose the GL functions.
 */

// Raylib's external/glad.h is included via rlgl.h
#define GRAPHICS_API_OPENGL_43  // Enable OpenGL 4.3+ features
#include "external/glad.h"  // Included in raylib source

#include <ridgeline/gpu/gpu_compute.hpp>

#include <iostream>
#include <cstring>

namespace ridgeline {
namespace gpu {

namespace {

inline GLenum target_of(BufferKind kind) {
    return kind == BufferKind::UNIFORM ? GL_UNIFORM_BUFFER : GL_SHADER_STORAGE_BUFFER;
}

} // namespace

// ============ GPUBuffer ============

void GPUBuffer::create(size_t bytes, BufferKind buffer_kind) {
    kind = buffer_kind;
    GLenum target = target_of(kind);
    glGenBuffers(1, &id);
    glBindBuffer(target, id);
    glBufferData(target, bytes, nullptr,
                 kind == BufferKind::UNIFORM ? GL_DYNAMIC_DRAW : GL_DYNAMIC_COPY);
    glBindBuffer(target, 0);
    size = bytes;
}

void GPUBuffer::upload(const void* data, size_t bytes) {
    GLenum target = target_of(kind);
    glBindBuffer(target, id);
    glBufferSubData(target, 0, bytes, data);
    glBindBuffer(target, 0);
}

bool GPUBuffer::download(void* data, size_t bytes) {
    if (bytes > size) {
        std::cerr << "[GPU] Readback of " << bytes << " bytes exceeds buffer size "
                  << size << std::endl;
        return false;
    }

    GLenum target = target_of(kind);
    glBindBuffer(target, id);
    void* gpu_data = glMapBufferRange(target, 0, bytes, GL_MAP_READ_BIT);
    bool ok = gpu_data != nullptr;
    if (ok) {
        std::memcpy(data, gpu_data, bytes);
        glUnmapBuffer(target);
    } else {
        std::cerr << "[GPU] Failed to map buffer " << id << " for readback" << std::endl;
    }
    glBindBuffer(target, 0);
    return ok;
}

void GPUBuffer::destroy() {
    if (id) {
        glDeleteBuffers(1, &id);
        id = 0;
        size = 0;
    }
}

// ============ ComputeShader ============

ComputeShader::~ComputeShader() {
    destroy();
}

void ComputeShader::destroy() {
    if (program_) {
        glDeleteProgram(program_);
        program_ = 0;
    }
}

bool ComputeShader::load(const std::string& source) {
    // Create compute shader
    GLuint shader = glCreateShader(GL_COMPUTE_SHADER);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    // Check compile errors
    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char log[512];
        glGetShaderInfoLog(shader, 512, nullptr, log);
        std::cerr << "[GPU] Compute shader compile error: " << log << std::endl;
        glDeleteShader(shader);
        return false;
    }

    // Create program
    program_ = glCreateProgram();
    glAttachShader(program_, shader);
    glLinkProgram(program_);
    glDeleteShader(shader);

    glGetProgramiv(program_, GL_LINK_STATUS, &success);
    if (!success) {
        char log[512];
        glGetProgramInfoLog(program_, 512, nullptr, log);
        std::cerr << "[GPU] Compute shader link error: " << log << std::endl;
        glDeleteProgram(program_);
        program_ = 0;
        return false;
    }

    std::cout << "[GPU] Compute shader loaded successfully" << std::endl;
    return true;
}

void ComputeShader::dispatch(int groups_x, int groups_y, int groups_z) {
    glUseProgram(program_);
    glDispatchCompute(groups_x, groups_y, groups_z);
}

void ComputeShader::set_uniform(const char* name, float value) {
    glUseProgram(program_);
    GLint loc = glGetUniformLocation(program_, name);
    glUniform1f(loc, value);
}

void ComputeShader::set_uniform(const char* name, int value) {
    glUseProgram(program_);
    GLint loc = glGetUniformLocation(program_, name);
    glUniform1i(loc, value);
}

void ComputeShader::set_uniform(const char* name, unsigned int value) {
    glUseProgram(program_);
    GLint loc = glGetUniformLocation(program_, name);
    glUniform1ui(loc, value);
}

void ComputeShader::set_uniform(const char* name, Vector3 value) {
    glUseProgram(program_);
    GLint loc = glGetUniformLocation(program_, name);
    glUniform3f(loc, value.x, value.y, value.z);
}

void ComputeShader::bind_buffer(int binding, GPUBuffer& buffer) {
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, binding, buffer.id);
}

void ComputeShader::bind_uniform_block(int binding, GPUBuffer& buffer) {
    glBindBufferBase(GL_UNIFORM_BUFFER, binding, buffer.id);
}

void ComputeShader::barrier() {
    glMemoryBarrier(GL_SHADER_STORAGE_BARRIER_BIT | GL_BUFFER_UPDATE_BARRIER_BIT);
}

} // namespace gpu
} // namespace ridgeline
