export module ECS;

export import :Components.Cloner;
export import :Systems.Cloner;
