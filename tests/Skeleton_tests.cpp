// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <memory>
#include <utility>
#include <vector>
#include <glm/gtc/matrix_transform.hpp>
#include "Errors.hpp"
#include "skeleton/Skeleton.hpp"
#include "skeleton/Deformer.hpp"

using namespace rigtime;

namespace
{
    // _root (0)
    // └─ hip (1) #0
    //     ├─ spine (2) #1
    //     │   └─ head (4) #5
    //     └─ pivot (3)
    struct Rig
    {
        Skeleton skeleton{ glm::translate(glm::mat4{ 1.0f }, glm::vec3(0.0f, 1.0f, 0.0f)) };
        size_t hip, spine, pivot, head;

        Rig()
        {
            hip = skeleton.add_bone(Bone{ "hip", 0 });
            spine = skeleton.add_bone(Bone{ "spine", 1 }, hip);
            pivot = skeleton.add_bone(Bone{ std::nullopt, std::nullopt }, hip);
            head = skeleton.add_bone(Bone{ "head", 5 }, spine);
        }
    };
}

TEST(SkeletonTest, RootBone)
{
    const glm::mat4 root_transform = glm::scale(glm::mat4{ 1.0f }, glm::vec3(2.0f));
    Skeleton skeleton(root_transform);

    EXPECT_EQ(skeleton.size(), 1u);
    EXPECT_EQ(skeleton.root(), 0u);
    EXPECT_EQ(skeleton.root_bone().identifier(), std::string(Skeleton::root_bone_name));
    EXPECT_FALSE(skeleton.root_bone().index().has_value());
    EXPECT_EQ(skeleton.root_bone().offset(), root_transform);
    EXPECT_FALSE(skeleton.parent_of(skeleton.root()).has_value());
    EXPECT_FALSE(skeleton.highest_bone_index().has_value());
}

TEST(SkeletonTest, Hierarchy)
{
    Rig rig;
    EXPECT_EQ(rig.skeleton.size(), 5u);
    EXPECT_EQ(rig.hip, 1u);
    EXPECT_EQ(rig.head, 4u);

    EXPECT_EQ(rig.skeleton.parent_of(rig.head), rig.spine);
    EXPECT_EQ(rig.skeleton.parent_of(rig.hip), rig.skeleton.root());
    EXPECT_EQ(rig.skeleton.children_of(rig.hip), (std::vector<size_t>{ rig.spine, rig.pivot }));

    EXPECT_EQ(rig.skeleton.find_bone("head"), rig.head);
    EXPECT_FALSE(rig.skeleton.find_bone("tail").has_value());
    EXPECT_EQ(rig.skeleton.get_bone(rig.spine).index(), 1);
    EXPECT_EQ(rig.skeleton.highest_bone_index(), 5);
}

TEST(SkeletonTest, UnknownNodes)
{
    Rig rig;
    EXPECT_FALSE(rig.skeleton.contains(42));
    EXPECT_THROW(rig.skeleton.get_bone(42), NotFoundError);
    EXPECT_THROW(rig.skeleton.add_bone(Bone{ "x", 2 }, 42), NotFoundError);
    EXPECT_THROW(rig.skeleton.parent_of(42), NotFoundError);
}

TEST(SkeletonTest, RemoveBranch)
{
    Rig rig;
    rig.skeleton.remove_bone(rig.spine);
    EXPECT_EQ(rig.skeleton.size(), 3u);
    EXPECT_FALSE(rig.skeleton.contains(rig.head));
    EXPECT_EQ(rig.skeleton.highest_bone_index(), 0);

    // Handles are not reused
    const size_t neck = rig.skeleton.add_bone(Bone{ "neck", 2 }, rig.hip);
    EXPECT_EQ(neck, 5u);
    EXPECT_TRUE(rig.skeleton.contains(rig.pivot));
}

TEST(SkeletonTest, RootCannotBeRemoved)
{
    Rig rig;
    EXPECT_THROW(rig.skeleton.remove_bone(rig.skeleton.root()), InvalidArgumentError);
}

TEST(SkeletonTest, SetBone)
{
    Rig rig;
    rig.skeleton.set_bone(rig.pivot, Bone{ "tail", 7 });
    EXPECT_EQ(rig.skeleton.find_bone("tail"), rig.pivot);
    EXPECT_EQ(rig.skeleton.highest_bone_index(), 7);
    EXPECT_EQ(rig.skeleton.parent_of(rig.pivot), rig.hip);
}

TEST(SkeletonTest, ReadOnlyViewSharesTree)
{
    Rig rig;
    Skeleton view = rig.skeleton.to_read_only(false);
    EXPECT_TRUE(view.is_read_only());
    EXPECT_FALSE(rig.skeleton.is_read_only());

    EXPECT_THROW(view.add_bone(Bone{ "x", 9 }), ReadOnlyError);
    EXPECT_THROW(view.remove_bone(rig.head), ReadOnlyError);
    EXPECT_THROW(view.set_bone(rig.head, Bone{}), ReadOnlyError);

    rig.skeleton.add_bone(Bone{ "arm", 9 }, rig.spine);
    EXPECT_EQ(view.size(), 6u);
    EXPECT_TRUE(view.find_bone("arm").has_value());
}

TEST(SkeletonTest, ReadOnlyCloneIsDetached)
{
    Rig rig;
    Skeleton clone = rig.skeleton.to_read_only(true);
    EXPECT_TRUE(clone.is_read_only());

    rig.skeleton.add_bone(Bone{ "arm", 9 }, rig.spine);
    EXPECT_EQ(clone.size(), 5u);
    EXPECT_FALSE(clone.find_bone("arm").has_value());
    EXPECT_THROW(clone.add_bone(Bone{ "x", 10 }), ReadOnlyError);
}

TEST(SkeletonTest, CopyIsDetached)
{
    Rig rig;
    Skeleton variant = rig.skeleton;
    EXPECT_FALSE(variant.is_read_only());

    variant.remove_bone(rig.spine);
    variant.set_bone(rig.pivot, Bone{ "tail", 7 });
    EXPECT_FALSE(variant.contains(rig.head));

    EXPECT_EQ(rig.skeleton.size(), 5u);
    EXPECT_TRUE(rig.skeleton.contains(rig.spine));
    EXPECT_TRUE(rig.skeleton.contains(rig.head));
    EXPECT_FALSE(rig.skeleton.find_bone("tail").has_value());
}

TEST(SkeletonTest, CopyAssignmentIsDetached)
{
    Rig rig;
    Skeleton other;
    other = rig.skeleton;
    EXPECT_EQ(other.size(), 5u);

    other.add_bone(Bone{ "arm", 9 }, rig.spine);
    EXPECT_EQ(other.size(), 6u);
    EXPECT_EQ(rig.skeleton.size(), 5u);
}

TEST(SkeletonTest, CopyOfViewKeepsReadOnly)
{
    Rig rig;
    const Skeleton view = rig.skeleton.to_read_only(false);
    Skeleton copy = view;
    EXPECT_TRUE(copy.is_read_only());
    EXPECT_THROW(copy.add_bone(Bone{ "x", 9 }), ReadOnlyError);

    // The copy is a snapshot, the view keeps following its source
    rig.skeleton.add_bone(Bone{ "arm", 9 }, rig.spine);
    EXPECT_EQ(view.size(), 6u);
    EXPECT_EQ(copy.size(), 5u);
}

TEST(SkeletonTest, MovedViewStillShares)
{
    Rig rig;
    Skeleton view = rig.skeleton.to_read_only(false);
    Skeleton moved = std::move(view);
    EXPECT_TRUE(moved.is_read_only());

    rig.skeleton.add_bone(Bone{ "arm", 9 }, rig.spine);
    EXPECT_TRUE(moved.find_bone("arm").has_value());
}

TEST(BoneTest, ToString)
{
    EXPECT_EQ(Bone("arm", 3).to_string(), "Bone \"arm\" (#3)");
    EXPECT_EQ(Bone("pivot", std::nullopt).to_string(), "Bone \"pivot\"");
    EXPECT_EQ(Bone().to_string(), "Unnamed bone");
}

TEST(BoneTest, Equality)
{
    EXPECT_EQ(Bone("arm", 3), Bone("arm", 3));
    EXPECT_FALSE(Bone("arm", 3) == Bone("arm", 4));
    EXPECT_FALSE(Bone("arm", 3) == Bone("arm", 3, glm::scale(glm::mat4{ 1.0f }, glm::vec3(2.0f))));
}

TEST(DeformerTest, EmptyByDefault)
{
    Deformer deformer;
    EXPECT_TRUE(deformer.empty());
    EXPECT_EQ(deformer.size(), 0u);
    EXPECT_THROW(deformer.at(0), InvalidArgumentError);
}

TEST(DeformerTest, Capacity)
{
    EXPECT_NO_THROW(Deformer::create(std::vector<glm::mat4>(Deformer::maximum_size, glm::mat4{ 1.0f })));
    EXPECT_THROW(Deformer::create(std::vector<glm::mat4>(Deformer::maximum_size + 1)), CapacityExceededError);

    auto oversized = std::make_shared<const std::vector<glm::mat4>>(Deformer::maximum_size + 1);
    EXPECT_THROW(Deformer::create(oversized, true), CapacityExceededError);
}

TEST(DeformerTest, NullBufferIsRejected)
{
    EXPECT_THROW(Deformer::create(nullptr, false), InvalidArgumentError);
}

TEST(DeformerTest, SharedOrClonedBuffer)
{
    auto buffer = std::make_shared<std::vector<glm::mat4>>(2, glm::mat4{ 1.0f });

    Deformer shared = Deformer::create(buffer, false);
    Deformer cloned = Deformer::create(buffer, true);
    EXPECT_EQ(shared.data(), buffer->data());
    EXPECT_NE(cloned.data(), buffer->data());

    (*buffer)[1] = glm::mat4{ 2.0f };
    EXPECT_EQ(shared[1], glm::mat4{ 2.0f });
    EXPECT_EQ(cloned[1], glm::mat4{ 1.0f });
    EXPECT_EQ(cloned.at(1), glm::mat4{ 1.0f });
    EXPECT_THROW(cloned.at(2), InvalidArgumentError);
}
