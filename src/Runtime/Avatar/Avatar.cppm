export module Avatar;

export import :Types;
export import :Model;
export import :RenderItem;
export import :Classifier;
export import :SortEngine;
export import :StateSelector;
export import :Morph;
export import :RenderSelection;
export import :StrictValidator;
export import :FrameSynchronizer;
