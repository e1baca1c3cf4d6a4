#pragma once

// Include after `import Core;`. Macros do not cross module boundaries.
#define MARIONETTE_PROFILE_CONCAT_INNER(a, b) a##b
#define MARIONETTE_PROFILE_CONCAT(a, b) MARIONETTE_PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) Core::Profiling::ScopedTimer MARIONETTE_PROFILE_CONCAT(profileTimer_, __LINE__)(name)
#define PROFILE_FUNCTION() PROFILE_SCOPE(__func__)
