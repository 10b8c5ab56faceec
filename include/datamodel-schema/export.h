#ifndef DATAMODEL_SCHEMA_EXPORT_H
#define DATAMODEL_SCHEMA_EXPORT_H

#ifdef _WIN32
#ifdef datamodel_schema_core_EXPORTS
#define DATAMODEL_SCHEMA_API __declspec(dllexport)
#else
#define DATAMODEL_SCHEMA_API __declspec(dllimport)
#endif
#else
#define DATAMODEL_SCHEMA_API
#endif

#endif // DATAMODEL_SCHEMA_EXPORT_H
