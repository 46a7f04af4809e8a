#include <QtTest/QTest>
#include "core.h"
#include "definition.h"

using namespace ndoc;

static Entry makeStruct(const QString& name, QVector<StructField> fields) {
    return Entry{ Category::Nt, StructDecl{name, std::move(fields)} };
}

static Entry makeTypedef(const QString& name, QStringList tokens) {
    return Entry{ Category::Nt, TypedefDecl{name, std::move(tokens)} };
}

class TestDefinition : public QObject {
    Q_OBJECT
private slots:
    void functionRaw() {
        Entry e{ Category::Nt, FunctionDecl{"NtClose", "NTSTATUS", {"HANDLE Handle"}, "Closes a handle."} };
        QCOMPARE(rawDefinition(e, {}), QStringLiteral("NTSTATUS NtClose(HANDLE Handle);"));
    }

    void functionRawParametersJoined() {
        Entry e{ Category::Nt, FunctionDecl{"NtReadFile", "NTSTATUS",
                 {"HANDLE FileHandle", "PVOID Buffer", "ULONG Length"}, {}} };
        QCOMPARE(rawDefinition(e, {}),
                 QStringLiteral("NTSTATUS NtReadFile(HANDLE FileHandle, PVOID Buffer, ULONG Length);"));
    }

    void functionRawNoParameters() {
        Entry e{ Category::Win32, FunctionDecl{"GetCurrentProcessId", "DWORD", {}, {}} };
        QCOMPARE(rawDefinition(e, {}), QStringLiteral("DWORD GetCurrentProcessId();"));
    }

    void defineRaw() {
        Entry e{ Category::Win32, DefineDecl{"MAX_PATH", "260"} };
        QCOMPARE(rawDefinition(e, {}), QStringLiteral("#define MAX_PATH 260"));
    }

    void typedefRaw() {
        Entry e = makeTypedef("PUNICODE_STRING", {"UNICODE_STRING", "*"});
        QCOMPARE(rawDefinition(e, {}), QStringLiteral("typedef UNICODE_STRING * PUNICODE_STRING;"));
    }

    void structWithoutTypedefStripsOneUnderscore() {
        Entry s = makeStruct("_CLIENT_ID", {{"UniqueProcess", "HANDLE"}, {"UniqueThread", "HANDLE"}});
        Catalog catalog{ s };
        QCOMPARE(rawDefinition(s, catalog), QStringLiteral(
            "typedef struct __CLIENT_ID {\n"
            "    HANDLE UniqueProcess;\n"
            "    HANDLE UniqueThread;\n"
            "} CLIENT_ID, *PCLIENT_ID;"));

        Entry doubled = makeStruct("__X", {});
        QCOMPARE(rawDefinition(doubled, {}), QStringLiteral(
            "typedef struct ___X {\n"
            "} _X, *P_X;"));
    }

    void structAliasFromTypedefSuffix() {
        Entry td = makeTypedef("UNICODE_STRING", {"struct", "_UNICODE_STRING"});
        Entry s = makeStruct("UNICODE_STRING", {{"Length", "USHORT"},
                                                {"MaximumLength", "USHORT"},
                                                {"Buffer", "PWSTR"}});
        Catalog catalog{ td, s };
        QCOMPARE(rawDefinition(s, catalog), QStringLiteral(
            "typedef struct _UNICODE_STRING {\n"
            "    USHORT Length;\n"
            "    USHORT MaximumLength;\n"
            "    PWSTR Buffer;\n"
            "} UNICODE_STRING, *PUNICODE_STRING;"));
    }

    void structAliasFromExactToken() {
        Entry td = makeTypedef("PFOO", {"_FOO", "*"});
        Entry s = makeStruct("_FOO", {{"a", "int"}});
        Catalog catalog{ s, td };
        QCOMPARE(structAlias(*s.as<StructDecl>(), catalog), QStringLiteral("PFOO"));
        QVERIFY(rawDefinition(s, catalog).endsWith(QStringLiteral("} PFOO, *PPFOO;")));
    }

    void structAliasFirstTypedefWins() {
        Entry first  = makeTypedef("FOO", {"struct", "_FOO"});
        Entry second = makeTypedef("PFOO", {"_FOO", "*"});
        Entry s = makeStruct("_FOO", {});
        QCOMPARE(structAlias(*s.as<StructDecl>(), Catalog{ first, second, s }), QStringLiteral("FOO"));
        QCOMPARE(structAlias(*s.as<StructDecl>(), Catalog{ second, first, s }), QStringLiteral("PFOO"));
    }

    void structAliasIgnoresNonTypedefs() {
        Entry d{ Category::Nt, DefineDecl{"BAR", "_FOO"} };
        Entry s = makeStruct("_FOO", {});
        QCOMPARE(structAlias(*s.as<StructDecl>(), Catalog{ d, s }), QStringLiteral("FOO"));
    }

    void unionRaw() {
        Entry u{ Category::Win32, UnionDecl{"_LARGE_INTEGER", {{"QuadPart", "LONGLONG"}, {"LowPart", "DWORD"}}} };
        // A matching typedef must not change union output
        Catalog catalog{ makeTypedef("LARGE_INTEGER", {"union", "_LARGE_INTEGER"}), u };
        QCOMPARE(rawDefinition(u, catalog), QStringLiteral(
            "union _LARGE_INTEGER {\n"
            "    LONGLONG QuadPart;\n"
            "    DWORD LowPart;\n"
            "};"));
    }

    void enumRaw() {
        Entry e{ Category::Nt, EnumDecl{"E", {{"A", 0}, {"B", std::nullopt}}} };
        QCOMPARE(rawDefinition(e, {}), QStringLiteral(
            "enum {\n"
            "    A = 0,\n"
            "    B,\n"
            "};"));
    }

    void enumLargeInitializer() {
        Entry e{ Category::Nt, EnumDecl{"E", {{"Top", quint64(0xFFFFFFFFFFFFFFFFull)}}} };
        QCOMPARE(rawDefinition(e, {}), QStringLiteral("enum {\n    Top = 18446744073709551615,\n};"));
    }

    void emptyTypeRenderedAsIs() {
        Entry s = makeStruct("S", {{"x", ""}});
        QCOMPARE(rawDefinition(s, {}), QStringLiteral("typedef struct _S {\n     x;\n} S, *PS;"));
    }

    void rawIsDeterministic() {
        Entry td = makeTypedef("FOO", {"struct", "_FOO"});
        Entry s = makeStruct("_FOO", {{"a", "int"}, {"b", "char*"}});
        Catalog catalog{ td, s };
        QCOMPARE(rawDefinition(s, catalog), rawDefinition(s, catalog));
        QCOMPARE(prettyDefinition(s, catalog), prettyDefinition(s, catalog));
    }

    void prettyFunction() {
        Entry e{ Category::Nt, FunctionDecl{"NtClose", "NTSTATUS", {"HANDLE Handle"}, "Closes a handle."} };
        QCOMPARE(prettyDefinition(e, {}), QStringLiteral(
            "Category: Nt\n\n"
            "Function `NtClose`\n"
            "Signature: NTSTATUS NtClose(HANDLE Handle);\n\n"
            "Description:\n"
            "Closes a handle.\n"));
    }

    void prettyDefine() {
        Entry e{ Category::Win32, DefineDecl{"MAX_PATH", "260"} };
        QCOMPARE(prettyDefinition(e, {}), QStringLiteral(
            "Category: Win32\n\n"
            "Define `MAX_PATH`\n\n"
            "#define MAX_PATH 260\n"));
    }

    void prettyTypedef() {
        Entry e = makeTypedef("NTSTATUS", {"LONG"});
        QCOMPARE(prettyDefinition(e, {}), QStringLiteral(
            "Category: Nt\n\n"
            "Typedef `NTSTATUS`\n\n"
            "typedef LONG NTSTATUS;\n"));
    }

    void prettyStructEmbedsRaw() {
        Entry td = makeTypedef("FOO", {"struct", "_FOO"});
        Entry s = makeStruct("_FOO", {{"a", "int"}});
        Catalog catalog{ td, s };
        QCOMPARE(prettyDefinition(s, catalog),
                 QStringLiteral("Category: Nt\n\nStruct `_FOO`\n\n")
                 + rawDefinition(s, catalog) + QStringLiteral("\n"));
    }

    void prettyUnion() {
        Entry u{ Category::Win32, UnionDecl{"U", {{"a", "int"}}} };
        QCOMPARE(prettyDefinition(u, {}), QStringLiteral(
            "Category: Win32\n\n"
            "Union `U`\n\n"
            "union U {\n"
            "    int a;\n"
            "};\n"));
    }

    void prettyEnumHasNoName() {
        Entry e{ Category::Nt, EnumDecl{"PROCESSINFOCLASS", {{"ProcessBasicInformation", 0}}} };
        QCOMPARE(prettyDefinition(e, {}), QStringLiteral(
            "Category: Nt\n\n"
            "Enum\n\n"
            "enum {\n"
            "    ProcessBasicInformation = 0,\n"
            "};\n"));
    }

    void prettyTitleIsKindName() {
        const Entry entries[] = {
            { Category::Nt, FunctionDecl{"NtClose", "NTSTATUS", {}, {}} },
            { Category::Nt, DefineDecl{"MAX_PATH", "260"} },
            makeTypedef("NTSTATUS", {"LONG"}),
            makeStruct("_FOO", {}),
            { Category::Nt, UnionDecl{"U", {}} },
            { Category::Nt, EnumDecl{"E", {}} },
        };
        for (const Entry& e : entries) {
            const QStringList lines = prettyDefinition(e, {}).split(QLatin1Char('\n'));
            QVERIFY(lines.size() > 2);
            const QString expected = e.is<EnumDecl>()
                ? QString::fromLatin1(e.kindName())
                : QString::fromLatin1(e.kindName()) + QStringLiteral(" `") + e.name() + QStringLiteral("`");
            QCOMPARE(lines[2], expected);
        }
    }
};

QTEST_MAIN(TestDefinition)
#include "test_definition.moc"
