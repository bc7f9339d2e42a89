export module Cloner;

// Re-export all parts so the user only needs 'import Cloner;'
export import :Random;
export import :Noise;
export import :Color;
export import :Spline;
export import :Instance;
export import :Config;
export import :Generators;
export import :Effectors;
export import :Calculator;
export import :Stats;
