module;
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // Local translation/rotation/scale relative to the parent node
    struct Component
    {
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 Scale{1.0f};
    };

    // Nodes authored with a raw local matrix. When present it replaces the TRS
    // of Component in the world matrix computation.
    struct LocalMatrix
    {
        glm::mat4 Matrix{1.0f};
    };

    // Marks an entity whose local transform changed since the last update.
    struct IsDirtyTag
    {
    };

    struct WorldMatrix
    {
        glm::mat4 Matrix{1.0f};
    };

    [[nodiscard]] inline glm::mat4 GetMatrix(const Component& transform)
    {
        glm::mat4 mat = glm::translate(glm::mat4(1.0f), transform.Position);
        mat = mat * glm::mat4_cast(transform.Rotation);
        mat = glm::scale(mat, transform.Scale);
        return mat;
    }
}
