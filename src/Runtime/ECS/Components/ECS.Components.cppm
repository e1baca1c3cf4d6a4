export module ECS:Components;

export import :Components.Hierarchy;
export import :Components.NameTag;
export import :Components.Transform;
