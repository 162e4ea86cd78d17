// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/GLMSerialize.hpp"

#include <string>
#include <nlohmann/json.hpp>

#include "Errors.hpp"

namespace rigtime::serializers
{
    namespace
    {
        void expect_numbers(const nlohmann::json& j, size_t count, const char* what)
        {
            if (!j.is_array() || j.size() != count)
                throw FormatError(std::string(what) + ": expected an array of " + std::to_string(count) + " numbers");
            for (const auto& e : j)
                if (!e.is_number())
                    throw FormatError(std::string(what) + ": non-numeric element");
        }

        template<typename VecT>
        nlohmann::json serialize_vec(const VecT& v)
        {
            nlohmann::json j = nlohmann::json::array();
            auto& arr = j.get_ref<nlohmann::json::array_t&>();
            const int n = static_cast<int>(VecT::length());
            arr.reserve(n);
            for (int i = 0; i < n; ++i)
                arr.emplace_back(v[i]);
            return j;
        }

        template<typename VecT>
        VecT deserialize_vec(const nlohmann::json& j, const char* what)
        {
            using scalar_t = typename VecT::value_type;
            expect_numbers(j, VecT::length(), what);

            VecT v{};
            for (int i = 0; i < static_cast<int>(VecT::length()); ++i)
                v[i] = j[static_cast<size_t>(i)].get<scalar_t>();
            return v;
        }
    } // namespace

    nlohmann::json serialize_vec2(const glm::vec2& v) { return serialize_vec(v); }
    nlohmann::json serialize_vec3(const glm::vec3& v) { return serialize_vec(v); }

    nlohmann::json serialize_quat(const glm::quat& q)
    {
        return nlohmann::json::array({ q.x, q.y, q.z, q.w });
    }

    nlohmann::json serialize_mat4(const glm::mat4& m)
    {
        nlohmann::json j = nlohmann::json::array();
        auto& arr = j.get_ref<nlohmann::json::array_t&>();
        arr.reserve(16);
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
                arr.emplace_back(m[c][r]);
        }
        return j;
    }

    glm::vec2 deserialize_vec2(const nlohmann::json& j) { return deserialize_vec<glm::vec2>(j, "vec2"); }
    glm::vec3 deserialize_vec3(const nlohmann::json& j) { return deserialize_vec<glm::vec3>(j, "vec3"); }

    glm::quat deserialize_quat(const nlohmann::json& j)
    {
        expect_numbers(j, 4, "quat");
        return glm::quat(j[3].get<float>(), j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
    }

    glm::mat4 deserialize_mat4(const nlohmann::json& j)
    {
        expect_numbers(j, 16, "mat4");

        glm::mat4 m{ 1.0f };
        size_t idx = 0;
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
                m[c][r] = j[idx++].get<float>();
        }
        return m;
    }
}
